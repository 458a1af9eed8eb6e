/* Copyright 2024 The flowexpr Authors. All Rights Reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *    http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <arpa/inet.h>

#include <array>
#include <cstdint>
#include <cstring>
#include <string>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "include/flowexpr/utils/status.h"
#include "src/flowexpr/functions/args.h"
#include "src/flowexpr/functions/registry.h"
#include "src/flowexpr/utils/status_macros.h"

namespace flowexpr {
namespace functions {
namespace {

// Network byte order. IPv4 uses the first four bytes.
struct Address {
  int version = 0;
  std::array<uint8_t, 16> bytes{};
};

struct Network {
  Address address;
  int prefix = 0;
};

bool ParseAddress(const std::string& text, int version, Address* out) {
  if (version != 6 && inet_pton(AF_INET, text.c_str(), out->bytes.data()) == 1) {
    out->version = 4;
    return true;
  }
  if (version != 4 &&
      inet_pton(AF_INET6, text.c_str(), out->bytes.data()) == 1) {
    out->version = 6;
    return true;
  }
  return false;
}

bool PrefixMatches(const Address& address, const Address& network,
                   int prefix) {
  int full_bytes = prefix / 8;
  if (std::memcmp(address.bytes.data(), network.bytes.data(), full_bytes) !=
      0) {
    return false;
  }
  int rest = prefix % 8;
  if (rest == 0) {
    return true;
  }
  uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rest));
  return (address.bytes[full_bytes] & mask) ==
         (network.bytes[full_bytes] & mask);
}

bool HostBitsClear(const Address& network, int prefix) {
  int width = network.version == 4 ? 32 : 128;
  for (int bit = prefix; bit < width; ++bit) {
    if (network.bytes[bit / 8] & (0x80 >> (bit % 8))) {
      return false;
    }
  }
  return true;
}

// "addr/prefix" or a bare address. Host bits must be zero.
absl::StatusOr<Network> ParseNetwork(const std::string& text, int version,
                                     absl::string_view function) {
  std::vector<std::string> parts = absl::StrSplit(text, absl::MaxSplits('/', 1));
  Network out;
  int width = version == 4 ? 32 : 128;
  out.prefix = width;
  if (!ParseAddress(parts[0], version, &out.address) ||
      (parts.size() == 2 &&
       (!absl::SimpleAtoi(parts[1], &out.prefix) || out.prefix < 0 ||
        out.prefix > width))) {
    return EvaluationError(absl::StrCat(function, "() '", text,
                                        "' does not appear to be an IPv",
                                        version, " network"));
  }
  if (!HostBitsClear(out.address, out.prefix)) {
    return EvaluationError(
        absl::StrCat(function, "() '", text, "' has host bits set"));
  }
  return out;
}

absl::StatusOr<Address> AddressArg(const Args& args, size_t index, int version,
                                   absl::string_view function) {
  FLOWEXPR_ASSIGN_OR_RETURN(std::string text, StringArg(args, index, function));
  Address out;
  if (!ParseAddress(text, version, &out)) {
    std::string kind =
        version == 0 ? "an IPv4 or IPv6" : absl::StrCat("an IPv", version);
    return EvaluationError(absl::StrCat(function, "() '", text,
                                        "' does not appear to be ", kind,
                                        " address"));
  }
  return out;
}

// Ranges that are not globally reachable.
struct Reserved {
  const char* network;
  int prefix;
};

const Reserved kReservedV4[] = {
    {"0.0.0.0", 8},       {"10.0.0.0", 8},       {"100.64.0.0", 10},
    {"127.0.0.0", 8},     {"169.254.0.0", 16},   {"172.16.0.0", 12},
    {"192.0.0.0", 24},    {"192.0.2.0", 24},     {"192.168.0.0", 16},
    {"198.18.0.0", 15},   {"198.51.100.0", 24},  {"203.0.113.0", 24},
    {"240.0.0.0", 4},     {"255.255.255.255", 32},
};

const Reserved kReservedV6[] = {
    {"::", 128},          {"::1", 128},         {"::ffff:0:0", 96},
    {"64:ff9b:1::", 48},  {"100::", 64},        {"2001::", 23},
    {"2001:db8::", 32},   {"2002::", 16},       {"fc00::", 7},
    {"fe80::", 10},
};

template <size_t N>
bool IsReserved(const Address& address, const Reserved (&ranges)[N]) {
  for (const auto& range : ranges) {
    Address network;
    ParseAddress(range.network, address.version, &network);
    if (PrefixMatches(address, network, range.prefix)) {
      return true;
    }
  }
  return false;
}

absl::StatusOr<Value> CheckIpVersion(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(Address address,
                            AddressArg(args, 0, 0, "check_ip_version"));
  return Value(address.version);
}

template <int kVersion>
absl::StatusOr<Value> InSubnet(const Args& args, const CallContext&) {
  const char* function = kVersion == 4 ? "ipv4_in_subnet" : "ipv6_in_subnet";
  FLOWEXPR_ASSIGN_OR_RETURN(Address address,
                            AddressArg(args, 0, kVersion, function));
  FLOWEXPR_ASSIGN_OR_RETURN(std::string subnet, StringArg(args, 1, function));
  FLOWEXPR_ASSIGN_OR_RETURN(Network network,
                            ParseNetwork(subnet, kVersion, function));
  return Value(PrefixMatches(address, network.address, network.prefix));
}

absl::StatusOr<Value> Ipv4IsPublic(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(Address address,
                            AddressArg(args, 0, 4, "ipv4_is_public"));
  return Value(!IsReserved(address, kReservedV4));
}

absl::StatusOr<Value> Ipv6IsPublic(const Args& args, const CallContext&) {
  FLOWEXPR_ASSIGN_OR_RETURN(Address address,
                            AddressArg(args, 0, 6, "ipv6_is_public"));
  return Value(!IsReserved(address, kReservedV6));
}

}  // namespace

absl::Status RegisterNetworkFunctions(Registry& registry) {
  const FunctionSpec specs[] = {
      {"check_ip_version", &CheckIpVersion, 1, 1, false},
      {"ipv4_in_subnet", &InSubnet<4>, 2, 2, false},
      {"ipv6_in_subnet", &InSubnet<6>, 2, 2, false},
      {"ipv4_is_public", &Ipv4IsPublic, 1, 1, false},
      {"ipv6_is_public", &Ipv6IsPublic, 1, 1, false},
  };
  for (const auto& spec : specs) {
    FLOWEXPR_RETURN_IF_ERROR(registry.Register(spec));
  }
  return absl::OkStatus();
}

}  // namespace functions
}  // namespace flowexpr
