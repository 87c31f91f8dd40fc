#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lnbridge::util {

/*
  Lower-case hex codec for payment hashes and preimages.
*/

std::string HexEncode(std::string_view bytes);

// std::nullopt on odd length or a non-hex character. Accepts either case.
std::optional<std::string> HexDecode(std::string_view hex);

} // namespace lnbridge::util
