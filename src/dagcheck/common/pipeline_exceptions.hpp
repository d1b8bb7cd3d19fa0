/**
 * @file pipeline_exceptions.hpp
 */
#pragma once
#include "dagcheck/common/common.hpp"

namespace dagcheck
{

/**
 * @brief Why a submitted pipeline could not be read.
 *
 * Problems inside individual node or edge records are not listed here. They
 * come back as a `Verdict` on an otherwise normal `ValidationResult`.
 */
enum class PipelineErrorCode
{
    /// A form field is not valid JSON text.
    DecodeError,
    /// A form field is valid JSON but not a list.
    ShapeError
};

inline const char* to_string(PipelineErrorCode code) noexcept
{
    switch (code)
    {
    case PipelineErrorCode::DecodeError:
        return "DecodeError";
    case PipelineErrorCode::ShapeError:
        return "ShapeError";
    }
    return "Unknown";
}

/**
 * @brief Raised when the `nodes` or `edges` field cannot be read as a list.
 *
 * Thrown by `decode_pipeline_field()` and `PipelineGraph::from_json()`.
 * `RequestRouter` catches it and sends `what()` back as `{"error": ...}` with
 * status 200, so the text must make sense to the person who submitted the
 * pipeline, e.g. `"Nodes data must be a list"`.
 */
class PipelineError : public std::runtime_error
{
public:
    PipelineError(PipelineErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , m_code(code)
    {
    }

    PipelineErrorCode code() const noexcept
    {
        return m_code;
    }

private:
    PipelineErrorCode m_code;
};

} // namespace dagcheck
