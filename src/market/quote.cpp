#include <bsa/market/quote.hpp>
#include <bsa/core/errors.hpp>

#include <algorithm>
#include <cctype>

namespace {

std::string normalize(const std::string& s) {
  auto notsp = [](unsigned char ch){ return !std::isspace(ch); };
  auto b = std::find_if(s.begin(), s.end(), notsp);
  auto e = std::find_if(s.rbegin(), s.rend(), notsp).base();
  std::string out = (b < e) ? std::string(b, e) : std::string();
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

namespace bsa {
namespace market {

const char* to_string(OptionKind kind) noexcept {
  switch (kind) {
    case OptionKind::Call: return "call";
    case OptionKind::Put:  return "put";
  }
  return "unknown";
}

std::optional<OptionKind> try_parse_option_kind(const std::string& label) {
  const std::string s = normalize(label);
  if (s == "call" || s == "c" || s == "ce") return OptionKind::Call;
  if (s == "put"  || s == "p" || s == "pe") return OptionKind::Put;
  return std::nullopt;
}

OptionKind parse_option_kind(const std::string& label) {
  if (auto kind = try_parse_option_kind(label)) {
    return *kind;
  }
  throw core::InvalidOptionKind("parse_option_kind: unknown option type '" + label + "'");
}

} // namespace market
} // namespace bsa
