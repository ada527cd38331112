#pragma once

#include <ducat/log/formatter.hpp>
#include <ducat/log/frontend.hpp>
#include <ducat/log/log.hpp>
