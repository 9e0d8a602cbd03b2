#pragma once

#include <fungible/log/log.hpp>
