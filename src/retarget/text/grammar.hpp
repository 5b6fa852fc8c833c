#pragma once
#include <tao/pegtl.hpp>

namespace retarget::text::grammar {
using namespace tao::pegtl;

// Comments and whitespace; commas count as whitespace.
struct comment : seq< one<';'>, until< eolf > > {};
struct skip : sor< one<' ', '\t', '\r', '\n', '\f', ','>, comment > {};
struct sep : star< skip > {};

struct sym_char : sor< alnum, one<'_', '-', '+', '*', '/', '<', '>', '=', '!', '?', '.', '`', '$', '%', '&', '#', '\''> > {};
struct sym_start : sor< alpha, one<'_', '-', '+', '*', '/', '<', '>', '=', '!', '?', '.', '$', '%', '&'> > {};

struct integer : seq< opt< one<'-'> >, plus< digit >, not_at< sym_char > > {};
struct symbol : seq< sym_start, star< sym_char > > {};
struct keyword : seq< one<':'>, plus< sym_char > > {};

struct escaped : seq< one<'\\'>, any > {};
struct string_body : star< sor< escaped, not_one<'"', '\\'> > > {};
struct string_lit : seq< one<'"'>, string_body, must< one<'"'> > > {};

struct form;
struct lparen : one<'('> {};
struct rparen : one<')'> {};
struct lbracket : one<'['> {};
struct rbracket : one<']'> {};
struct list : seq< lparen, sep, star< form, sep >, must< rparen > > {};
struct vector : seq< lbracket, sep, star< form, sep >, must< rbracket > > {};

struct form : sor< list, vector, string_lit, keyword, integer, symbol > {};

struct file : seq< sep, star< form, sep >, must< eof > > {};

} // namespace retarget::text::grammar
