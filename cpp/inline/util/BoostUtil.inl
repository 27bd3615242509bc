#include "util/BoostUtil.hpp"

#include "util/Exceptions.hpp"
#include "util/ScreenUtil.hpp"

#include <fmt/format.h>

#include <utility>

namespace boost_util {

namespace program_options {

template <typename StrSeq, util::concepts::IntSequence CharSeq>
options_description<StrSeq, CharSeq>::options_description(const char* name)
    : base_(std::make_shared<base_t>(name, util::get_screen_width() - 1)) {}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char, typename... Ts>
auto options_description<StrSeq, CharSeq>::add_option(Ts&&... ts) {
  auto out = augment<StrLit, Char>();
  std::string name = boost_name<StrLit, Char>();
  out.base_->add_options()(name.c_str(), std::forward<Ts>(ts)...);
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
auto options_description<StrSeq, CharSeq>::add_flag(bool* flag, const char* true_help,
                                                    const char* false_help) {
  namespace po = boost::program_options;

  auto out = augment<TrueStrLit>().template augment<FalseStrLit>();

  std::string full_true_help = true_help;
  std::string full_false_help = false_help;
  (*flag ? full_true_help : full_false_help) += " (default)";

  out.base_->add_options()(TrueStrLit.value, po::value(flag)->implicit_value(true)->zero_tokens(),
                           full_true_help.c_str())(
    FalseStrLit.value, po::value(flag)->implicit_value(false)->zero_tokens(),
    full_false_help.c_str());
  return out;
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
auto options_description<StrSeq, CharSeq>::add(const options_description<StrSeq2, CharSeq2>& desc) {
  static_assert(util::no_overlap_v<StrSeq, StrSeq2>, "Options name clash!");
  static_assert(util::no_overlap_v<CharSeq, CharSeq2>, "Options abbreviation clash!");

  using StrSeq3 = util::concat_string_literal_sequence_t<StrSeq, StrSeq2>;
  using CharSeq3 = util::concat_int_sequence_t<CharSeq, CharSeq2>;

  base_->add(*desc.base_);
  return options_description<StrSeq3, CharSeq3>(base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
auto options_description<StrSeq, CharSeq>::augment() const {
  static_assert(!util::string_literal_sequence_contains_v<StrSeq, StrLit>, "Options name clash!");
  constexpr bool UsingAbbrev = Char != ' ';
  static_assert(!UsingAbbrev || !util::int_sequence_contains_v<CharSeq, int(Char)>,
                "Options abbreviation clash!");

  using StrSeq2 =
    util::concat_string_literal_sequence_t<StrSeq, util::StringLiteralSequence<StrLit>>;
  using CharSeq2 = std::conditional_t<
    UsingAbbrev, util::concat_int_sequence_t<CharSeq, util::int_sequence<int(Char)>>, CharSeq>;

  return options_description<StrSeq2, CharSeq2>(base_);
}

template <typename StrSeq, util::concepts::IntSequence CharSeq>
template <util::StringLiteral StrLit, char Char>
std::string options_description<StrSeq, CharSeq>::boost_name() {
  // boost spells "long name + short name" as "name,c"
  if (Char == ' ') return StrLit.value;
  return fmt::format("{},{}", StrLit.value, Char);
}

namespace detail {

template <typename T>
const T& unwrap(const T& t) {
  return t;
}

template <typename S, util::concepts::IntSequence C>
const auto& unwrap(const options_description<S, C>& t) {
  return t.get();
}

}  // namespace detail

template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts) {
  namespace po = boost::program_options;
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Ts>(ts)...).options(detail::unwrap(desc)).run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
