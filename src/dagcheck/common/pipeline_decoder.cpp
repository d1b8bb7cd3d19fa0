/**
 * @file pipeline_decoder.cpp
 */
#include "dagcheck/common/pipeline_decoder.hpp"

namespace dagcheck
{

nlohmann::json decode_pipeline_field(const std::string& text, PipelineSide side)
{
    try
    {
        return nlohmann::json::parse(text);
    }
    catch (const nlohmann::json::parse_error& e)
    {
        throw PipelineError(
            PipelineErrorCode::DecodeError,
            std::string("Invalid JSON in ") + to_string(side) + ": " + e.what());
    }
}

} // namespace dagcheck
