#ifndef CHRONICLE_CORE_HPP
#define CHRONICLE_CORE_HPP

#include <chronicle/core/dynamic.hpp>
#include <chronicle/core/exception.hpp>
#include <chronicle/core/normalization.hpp>
#include <chronicle/core/object_id.hpp>
#include <chronicle/core/type_definitions.hpp>
#include <chronicle/core/type_interfaces.hpp>
#include <chronicle/core/utilities.hpp>

#endif
