#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"
#include "util/ScreenUtil.hpp"

#include <boost/make_shared.hpp>

namespace boost_util {

namespace program_options {

inline detail::option_tables_t::option_tables_t(const char* caption)
    : all(caption, util::get_screen_width() - 1), listed(caption, util::get_screen_width() - 1) {}

template <typename Names, typename Abbrevs>
options_description<Names, Abbrevs>::options_description(const char* caption)
    : tables_(std::make_shared<detail::option_tables_t>(caption)) {}

template <typename Names, typename Abbrevs>
template <util::StringLiteral Name, char Abbrev>
auto options_description<Names, Abbrevs>::add_option(const char* help) {
  return add_option<Name, Abbrev>(new po::untyped_value(true), help);
}

template <typename Names, typename Abbrevs>
template <util::StringLiteral Name, char Abbrev>
auto options_description<Names, Abbrevs>::add_option(const po::value_semantic* semantic,
                                                     const char* help) {
  std::string names(Name.value);
  if (Abbrev != ' ') {
    names += std::format(",{}", Abbrev);
  }
  auto option = boost::make_shared<po::option_description>(names.c_str(), semantic, help);
  return insert<Name, Abbrev>(option, false);
}

template <typename Names, typename Abbrevs>
template <util::StringLiteral Name>
auto options_description<Names, Abbrevs>::add_hidden_option(const po::value_semantic* semantic,
                                                            const char* help) {
  auto option = boost::make_shared<po::option_description>(Name.value, semantic, help);
  return insert<Name, ' '>(option, true);
}

template <typename Names, typename Abbrevs>
template <util::StringLiteral Name, util::StringLiteral Negation>
auto options_description<Names, Abbrevs>::add_flag(bool* flag, const char* help,
                                                   const char* negation_help) {
  auto set = boost::make_shared<po::option_description>(
    Name.value, po::value(flag)->implicit_value(true)->zero_tokens(), help);
  auto clear = boost::make_shared<po::option_description>(
    Negation.value, po::value(flag)->implicit_value(false)->zero_tokens(), negation_help);

  tables_->all.add(set);
  tables_->all.add(clear);
  tables_->listed.add(*flag ? clear : set);
  return extended<Name, ' '>().template extended<Negation, ' '>();
}

template <typename Names, typename Abbrevs>
template <typename Names2, typename Abbrevs2>
auto options_description<Names, Abbrevs>::add(const options_description<Names2, Abbrevs2>& other) {
  using name_union_t = util::list_union<Names, Names2>;
  using abbrev_union_t = util::list_union<Abbrevs, Abbrevs2>;
  static_assert(name_union_t::disjoint, "option defined twice");
  static_assert(abbrev_union_t::disjoint, "option abbreviation used twice");

  tables_->all.add(other.tables_->all);
  tables_->listed.add(other.tables_->listed);
  return options_description<typename name_union_t::type, typename abbrev_union_t::type>(tables_);
}

template <typename Names, typename Abbrevs>
template <util::StringLiteral Name, char Abbrev>
auto options_description<Names, Abbrevs>::extended() const {
  using name_union_t = util::list_union<Names, util::NameList<Name>>;
  static_assert(name_union_t::disjoint, "option defined twice");

  if constexpr (Abbrev == ' ') {
    return options_description<typename name_union_t::type, Abbrevs>(tables_);
  } else {
    using abbrev_union_t = util::list_union<Abbrevs, util::CharList<Abbrev>>;
    static_assert(abbrev_union_t::disjoint, "option abbreviation used twice");
    return options_description<typename name_union_t::type, typename abbrev_union_t::type>(
      tables_);
  }
}

template <typename Names, typename Abbrevs>
template <util::StringLiteral Name, char Abbrev>
auto options_description<Names, Abbrevs>::insert(boost::shared_ptr<po::option_description> option,
                                                 bool hidden) {
  tables_->all.add(option);
  if (!hidden) {
    tables_->listed.add(option);
  }
  return extended<Name, Abbrev>();
}

template <typename Names, typename Abbrevs, typename... Args>
po::variables_map parse_args(const options_description<Names, Abbrevs>& desc, Args&&... args) {
  po::variables_map vm;
  try {
    po::store(po::command_line_parser(std::forward<Args>(args)...).options(desc.all()).run(), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    throw util::CleanException("{}", e.what());
  }
  return vm;
}

}  // namespace program_options

}  // namespace boost_util
