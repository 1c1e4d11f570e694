#pragma once

/*
===============================================================================
wheelbuf — Public API Entry Point
===============================================================================

Fixed-capacity, allocation-free ring buffer that overwrites its oldest
element when full and can be read any number of times without consuming.

  wheelbuf::wheel_buffer   — the container, its cursor and STL iterator
  wheelbuf::push_iterator  — output iterator for algorithms / std::format_to
  wheelbuf::Error          — write outcome
  wheelbuf::log            — leveled logger used by the library and tools
===============================================================================
*/

#include <wheelbuf/version.hpp>
#include <wheelbuf/error.hpp>
#include <wheelbuf/storage_concept.hpp>
#include <wheelbuf/push_iterator.hpp>
#include <wheelbuf/wheel_buffer.hpp>
#include <wheelbuf/log/logger.hpp>
