#include "matview/jobs/run_errors.hpp"

#include <string>

namespace matview::jobs {

namespace {

class RunErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "matview.jobs";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<RunErrc>(condition)) {
        case RunErrc::Success:
            return "success";
        case RunErrc::InvalidTransition:
            return "run status transition not allowed";
        case RunErrc::DefinitionNotFound:
            return "materialized view definition not found";
        case RunErrc::DefinitionInvalid:
            return "materialized view definition is invalid";
        case RunErrc::DuplicateDefinition:
            return "a definition with this name already exists";
        case RunErrc::RunNotFound:
            return "run not found";
        default:
            return "unknown run error";
        }
    }
};

const RunErrorCategory kCategory{};

}  // namespace

const std::error_category& run_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(RunErrc value) noexcept
{
    return {static_cast<int>(value), run_error_category()};
}

}  // namespace matview::jobs
