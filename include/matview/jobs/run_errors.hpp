#pragma once

#include <system_error>

namespace matview::jobs {

enum class RunErrc {
    Success = 0,
    InvalidTransition,
    DefinitionNotFound,
    DefinitionInvalid,
    DuplicateDefinition,
    RunNotFound
};

const std::error_category& run_error_category() noexcept;
std::error_code make_error_code(RunErrc value) noexcept;

}  // namespace matview::jobs

namespace std {

template <>
struct is_error_code_enum<matview::jobs::RunErrc> : true_type {
};

}  // namespace std
