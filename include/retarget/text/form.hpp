// Parsed manifest forms with source positions.
#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace retarget::text {

struct Form;
using FormPtr = std::shared_ptr<Form>;

struct Symbol { std::string name; };
struct Keyword { std::string name; };
struct List { std::vector<FormPtr> elems; };
struct Vector { std::vector<FormPtr> elems; };

using FormData = std::variant<std::monostate, bool, int64_t, std::string, Symbol, Keyword, List, Vector>;

struct Form {
    FormData data;
    int line = 0;
    int col = 0;
};

inline const Symbol* as_symbol(const FormPtr& f){ return f ? std::get_if<Symbol>(&f->data) : nullptr; }
inline const Keyword* as_keyword(const FormPtr& f){ return f ? std::get_if<Keyword>(&f->data) : nullptr; }
inline const List* as_list(const FormPtr& f){ return f ? std::get_if<List>(&f->data) : nullptr; }
inline const Vector* as_vector(const FormPtr& f){ return f ? std::get_if<Vector>(&f->data) : nullptr; }
inline bool is_symbol(const FormPtr& f, const char* name){ auto s = as_symbol(f); return s && s->name == name; }

// Head symbol of a list form, or empty.
inline std::string head_of(const FormPtr& f){
    auto l = as_list(f);
    if(!l || l->elems.empty()) return {};
    auto s = as_symbol(l->elems.front());
    return s ? s->name : std::string();
}

std::string to_string(const FormPtr& f);

} // namespace retarget::text
