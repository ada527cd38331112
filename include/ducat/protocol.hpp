#pragma once

#include <ducat/protocol/account.hpp>
#include <ducat/protocol/event.hpp>
