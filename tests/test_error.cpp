/* Copyright (C) 2025 Kevin Exton (kevin.exton@pm.me)
 *
 * tftpsrv is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tftpsrv is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with tftpsrv.  If not, see <https://www.gnu.org/licenses/>.
 */
// NOLINTBEGIN
#include "tftpsrv/error.hpp"
#include "tftpsrv/protocol/tftp_protocol.hpp"

#include <gtest/gtest.h>

using namespace tftpsrv;

TEST(ErrorTest, CategoryName)
{
  EXPECT_STREQ(category().name(), "tftpsrv");
  EXPECT_EQ(&make_error_code(errc::timed_out).category(), &category());
}

TEST(ErrorTest, Messages)
{
  EXPECT_EQ(make_error_code(errc::malformed_packet).message(),
            "Malformed packet.");
  EXPECT_EQ(make_error_code(errc::unknown_opcode).message(), "Unknown opcode.");
  EXPECT_EQ(make_error_code(errc::unexpected_packet).message(),
            "Unexpected packet.");
  EXPECT_EQ(make_error_code(errc::peer_aborted).message(),
            "Transfer aborted by peer.");
  EXPECT_EQ(make_error_code(errc::timed_out).message(), "Timed out.");
}

TEST(ErrorTest, ProtocolErrorsAreIllegalOperations)
{
  EXPECT_EQ(to_wire_error(errc::malformed_packet), messages::ILLEGAL_OPERATION);
  EXPECT_EQ(to_wire_error(errc::unknown_opcode), messages::ILLEGAL_OPERATION);
  EXPECT_EQ(to_wire_error(errc::unexpected_packet),
            messages::ILLEGAL_OPERATION);
}

TEST(ErrorTest, TimeoutsAndAborts)
{
  EXPECT_EQ(to_wire_error(errc::timed_out), messages::TIMED_OUT);
  EXPECT_EQ(to_wire_error(errc::peer_aborted), messages::NOT_DEFINED);
}

TEST(ErrorTest, FileErrors)
{
  EXPECT_EQ(to_wire_error(std::make_error_code(
                std::errc::no_such_file_or_directory)),
            messages::FILE_NOT_FOUND);
  EXPECT_EQ(to_wire_error(std::make_error_code(std::errc::permission_denied)),
            messages::ACCESS_VIOLATION);
  EXPECT_EQ(
      to_wire_error(std::make_error_code(std::errc::operation_not_permitted)),
      messages::ACCESS_VIOLATION);
  EXPECT_EQ(to_wire_error(std::make_error_code(std::errc::no_space_on_device)),
            messages::DISK_FULL);
  EXPECT_EQ(to_wire_error(std::make_error_code(std::errc::io_error)),
            messages::DISK_FULL);
}

TEST(ErrorTest, SystemErrorsCompareToGenericConditions)
{
  auto err = std::error_code(ENOENT, std::system_category());
  EXPECT_EQ(to_wire_error(err), messages::FILE_NOT_FOUND);
}

TEST(ErrorTest, EverythingElseIsNotDefined)
{
  EXPECT_EQ(to_wire_error(std::make_error_code(std::errc::connection_reset)),
            messages::NOT_DEFINED);
  EXPECT_EQ(to_wire_error(std::error_code()), messages::NOT_DEFINED);
}
// NOLINTEND
