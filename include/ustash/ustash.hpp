/**
 * @file ustash.hpp
 * @author Ashot Vardanian
 * @date 26 Jun 2022
 *
 * @brief Typed persistence on top of transactional bucket stores.
 *
 * > Codecs: `binary_codec_t`, `json_codec_t`, `xml_codec_t`.
 * > Wrappers: `primed_codec_t`, built with `primer_t`, and `pooled_codec_gt`.
 * > Storage: `database_t` and `store_t`.
 */

#pragma once
#include "ustash/config.hpp"
#include "ustash/codecs.hpp"
#include "ustash/primed_codec.hpp"
#include "ustash/pooled_codec.hpp"
#include "ustash/store.hpp"
