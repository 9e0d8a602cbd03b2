#pragma once

#include <fungible/token/error.hpp>
#include <fungible/token/event_sink.hpp>
#include <fungible/token/events.hpp>
#include <fungible/token/ledger.hpp>
#include <fungible/token/mapping.hpp>
#include <fungible/token/object_store.hpp>
