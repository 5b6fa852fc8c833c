#include "retarget/text/reader.hpp"
#include "retarget/errors.hpp"
#include "grammar.hpp"

#include <sstream>
#include <stdexcept>
#include <tao/pegtl.hpp>

namespace retarget::text {

namespace {

struct read_state {
    struct frame { bool vector = false; int line = 0; int col = 0; std::vector<FormPtr> elems; };
    std::vector<frame> stack{frame{}};
    std::string pending; // unescaped string body

    void push_atom(FormData d, int line, int col){
        stack.back().elems.push_back(std::make_shared<Form>(Form{std::move(d), line, col}));
    }
};

template<typename Input>
int line_of(const Input& in){ return static_cast<int>(in.position().line); }
template<typename Input>
int col_of(const Input& in){ return static_cast<int>(in.position().column); }

template<typename Rule>
struct action : tao::pegtl::nothing<Rule> {};

template<> struct action< grammar::integer > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        try {
            st.push_atom(static_cast<int64_t>(std::stoll(in.string())), line_of(in), col_of(in));
        } catch (const std::out_of_range&) {
            throw tao::pegtl::parse_error("integer literal out of range", in);
        }
    }
};

template<> struct action< grammar::symbol > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        std::string s = in.string();
        if(s == "true") st.push_atom(true, line_of(in), col_of(in));
        else if(s == "false") st.push_atom(false, line_of(in), col_of(in));
        else if(s == "nil") st.push_atom(std::monostate{}, line_of(in), col_of(in));
        else st.push_atom(Symbol{std::move(s)}, line_of(in), col_of(in));
    }
};

template<> struct action< grammar::keyword > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        st.push_atom(Keyword{in.string().substr(1)}, line_of(in), col_of(in));
    }
};

template<> struct action< grammar::string_body > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        const std::string raw = in.string();
        std::string out;
        for(size_t i=0;i<raw.size();++i){
            char c = raw[i];
            if(c != '\\' || i + 1 == raw.size()){ out.push_back(c); continue; }
            char n = raw[++i];
            switch(n){
                case 'n': out.push_back('\n'); break;
                case 't': out.push_back('\t'); break;
                case 'r': out.push_back('\r'); break;
                default: out.push_back(n); break;
            }
        }
        st.pending = std::move(out);
    }
};

template<> struct action< grammar::string_lit > {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        st.push_atom(std::move(st.pending), line_of(in), col_of(in));
        st.pending.clear();
    }
};

template<bool IsVector>
struct open_action {
    template<typename Input>
    static void apply(const Input& in, read_state& st){
        read_state::frame f; f.vector = IsVector; f.line = line_of(in); f.col = col_of(in);
        st.stack.push_back(std::move(f));
    }
};
struct close_action {
    template<typename Input>
    static void apply(const Input&, read_state& st){
        read_state::frame f = std::move(st.stack.back());
        st.stack.pop_back();
        FormData d = f.vector ? FormData{Vector{std::move(f.elems)}} : FormData{List{std::move(f.elems)}};
        st.push_atom(std::move(d), f.line, f.col);
    }
};
template<> struct action< grammar::lparen > : open_action<false> {};
template<> struct action< grammar::lbracket > : open_action<true> {};
template<> struct action< grammar::rparen > : close_action {};
template<> struct action< grammar::rbracket > : close_action {};

void render(std::ostringstream& os, const FormPtr& f){
    std::visit([&](const auto& v){
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) os << "nil";
        else if constexpr (std::is_same_v<T, bool>) os << (v ? "true" : "false");
        else if constexpr (std::is_same_v<T, int64_t>) os << v;
        else if constexpr (std::is_same_v<T, std::string>) os << '"' << v << '"';
        else if constexpr (std::is_same_v<T, Symbol>) os << v.name;
        else if constexpr (std::is_same_v<T, Keyword>) os << ':' << v.name;
        else {
            const bool vec = std::is_same_v<T, Vector>;
            os << (vec ? '[' : '(');
            for(size_t i=0;i<v.elems.size();++i){ if(i) os << ' '; render(os, v.elems[i]); }
            os << (vec ? ']' : ')');
        }
    }, f->data);
}

} // namespace

std::vector<FormPtr> read(std::string_view src, const std::string& source_name){
    tao::pegtl::memory_input in(src.data(), src.size(), source_name);
    read_state st;
    try {
        tao::pegtl::parse< grammar::file, action >(in, st);
    } catch (const tao::pegtl::parse_error& e) {
        auto p = e.positions().front();
        Diagnostic d{"E1001", e.what(), "check for unbalanced brackets or an unterminated string",
                     static_cast<int>(p.line), static_cast<int>(p.column), {}};
        throw RetargetError(std::move(d));
    }
    return std::move(st.stack.front().elems);
}

std::string to_string(const FormPtr& f){
    if(!f) return "nil";
    std::ostringstream os;
    render(os, f);
    return os.str();
}

} // namespace retarget::text
