#include <chronicle/core/utilities.hpp>

#include <cstdlib>

namespace chronicle {

optional<string>
get_optional_environment_variable(string const& name)
{
    char const* value = std::getenv(name.c_str());
    return value && *value != '\0' ? some(string(value)) : none;
}

} // namespace chronicle
