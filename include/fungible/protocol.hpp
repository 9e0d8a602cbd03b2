#pragma once

#include <fungible/protocol/account.hpp>
#include <fungible/protocol/event.hpp>
#include <fungible/protocol/program.hpp>
#include <fungible/protocol/receipt.hpp>
