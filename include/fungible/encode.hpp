#pragma once

#include <fungible/encode/error.hpp>
#include <fungible/encode/hex.hpp>
