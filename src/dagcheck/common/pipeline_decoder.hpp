/**
 * @file pipeline_decoder.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"
#include "dagcheck/common/pipeline_enums.hpp"
#include "dagcheck/common/pipeline_exceptions.hpp"

#include <nlohmann/json.hpp>

namespace dagcheck
{

/**
 * @brief Decode the JSON text of one submitted field.
 * @param text The raw field value, expected to hold a JSON list.
 * @param side Which field the text came from, used in the error message.
 * @return The decoded JSON value (not necessarily a list).
 * @throw PipelineError with `DecodeError` if the text is not valid JSON. The
 *        message names the field and carries the parser's own message.
 */
nlohmann::json decode_pipeline_field(const std::string& text, PipelineSide side);

} // namespace dagcheck
