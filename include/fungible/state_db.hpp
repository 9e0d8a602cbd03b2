#pragma once

#include <fungible/state_db/backends/backend.hpp>
#include <fungible/state_db/backends/file/file_backend.hpp>
#include <fungible/state_db/backends/map/map_backend.hpp>
#include <fungible/state_db/error.hpp>
#include <fungible/state_db/state_delta.hpp>
#include <fungible/state_db/types.hpp>
