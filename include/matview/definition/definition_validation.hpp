#pragma once

#include "matview/definition/view_definition.hpp"
#include "matview/service/service_errors.hpp"

#include <string_view>
#include <system_error>

namespace matview::definition {

bool is_valid_view_name(std::string_view name) noexcept;
bool is_select_statement(std::string_view sql) noexcept;

std::error_code validate_view_name(std::string_view name) noexcept;
std::error_code validate_select_statement(std::string_view sql) noexcept;
std::error_code validate_definition(const ViewDefinition& definition);

}  // namespace matview::definition
