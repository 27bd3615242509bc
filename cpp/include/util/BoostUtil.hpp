#pragma once

#include "util/CppUtil.hpp"

#include <boost/program_options.hpp>

#include <memory>
#include <ostream>
#include <string>

namespace boost_util {

namespace program_options {

/*
 * A thin wrapper around boost::program_options::options_description that detects option-name
 * and abbreviation clashes at compile time rather than at parse time.
 *
 * Every add_*() call returns a new options_description whose type records the names added so far.
 * All descriptions in a chain share one underlying boost description.
 *
 * Usage:
 *
 * namespace po2 = boost_util::program_options;
 * po2::options_description desc("TicTacToe options");
 * return desc
 *     .add_option<"board-size", 'b'>(po::value<int>(&board_size), "...")
 *     .add_flag<"verbose", "quiet">(&verbose, "...", "...");
 */
template <typename StrSeq_ = util::StringLiteralSequence<>,
          util::concepts::IntSequence CharSeq_ = util::int_sequence<>>
class options_description {
 public:
  using StrSeq = StrSeq_;
  using CharSeq = CharSeq_;

  using base_t = boost::program_options::options_description;

  options_description(const char* name);

  // The arguments after the name are forwarded to boost's add_options()(name, ...).
  template <util::StringLiteral StrLit, char Char = ' ', typename... Ts>
  auto add_option(Ts&&... ts);

  // Adds both --TrueStrLit and --FalseStrLit, which set *flag to true and false respectively.
  template <util::StringLiteral TrueStrLit, util::StringLiteral FalseStrLit>
  auto add_flag(bool* flag, const char* true_help, const char* false_help);

  // Adds all options from desc to this, as a named group.
  template <typename StrSeq2, util::concepts::IntSequence CharSeq2>
  auto add(const options_description<StrSeq2, CharSeq2>& desc);

  friend std::ostream& operator<<(std::ostream& s, const options_description& desc) {
    return s << *desc.base_;
  }

  const base_t& get() const { return *base_; }

 private:
  explicit options_description(std::shared_ptr<base_t> base) : base_(std::move(base)) {}

  template <util::StringLiteral StrLit, char Char = ' '>
  auto augment() const;

  template <util::StringLiteral StrLit, char Char = ' '>
  static std::string boost_name();

  template <typename, util::concepts::IntSequence>
  friend class boost_util::program_options::options_description;

  std::shared_ptr<base_t> base_;
};

/*
 * Constructs a boost::program_options::command_line_parser out of ts (argc/argv, or a vector of
 * strings), parses it against desc, and returns the resulting variables_map. desc can be either a
 * boost or a boost_util options_description.
 *
 * Parse errors are rethrown as util::CleanException.
 */
template <typename T, typename... Ts>
boost::program_options::variables_map parse_args(const T& desc, Ts&&... ts);

}  // namespace program_options

}  // namespace boost_util

#include "inline/util/BoostUtil.inl"
