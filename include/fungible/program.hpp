#pragma once

#include <fungible/program/error.hpp>
#include <fungible/program/program.hpp>
#include <fungible/program/system_interface.hpp>
#include <fungible/program/token_program.hpp>
