#pragma once

#include <ducat/token/error.hpp>
#include <ducat/token/event_sink.hpp>
#include <ducat/token/ledger.hpp>
#include <ducat/token/transfer_engine.hpp>
#include <ducat/token/types.hpp>
