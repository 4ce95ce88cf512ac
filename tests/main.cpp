// SPDX-License-Identifier: MIT
// nearrpc - Test Runner
// Copyright (c) 2024-2026 nearrpc Contributors

#define BOOST_TEST_MODULE nearrpc
#include <boost/test/unit_test.hpp>

#include "mock_transport.hpp"
#include <boost/algorithm/string/predicate.hpp>

namespace nearrpc
{
namespace test
{

size_t
count_header (const HeaderList &headers, const std::string &name)
{
  size_t count = 0;
  for (const auto &header : headers)
    {
      if (boost::algorithm::iequals (header.first, name))
        ++count;
    }
  return count;
}

} // namespace test
} // namespace nearrpc
