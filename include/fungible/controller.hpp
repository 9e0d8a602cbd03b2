#pragma once

#include <fungible/controller/controller.hpp>
#include <fungible/controller/error.hpp>
#include <fungible/controller/state.hpp>
