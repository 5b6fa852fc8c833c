#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "retarget/diagnostics_json.hpp"
#include "retarget/jit/emitter.hpp"
#include "retarget/printer.hpp"
#include "retarget/replacer.hpp"
#include "retarget/text/loader.hpp"

using namespace retarget;

static bool read_file(const std::string& path, std::string& out){
    std::ifstream ifs(path); if(!ifs) return false;
    std::stringstream ss; ss<<ifs.rdbuf(); out = ss.str(); return true;
}

static int report(const std::vector<Diagnostic>& ds, bool json){
    if(json) std::cout << diagnostics_to_json(ds) << "\n";
    else for(auto& d : ds) std::cerr << format_diagnostic(d);
    maybe_print_json(ds);
    return ds.empty() ? 0 : 2;
}

int main(int argc, char** argv){
    if(argc<2){ std::cerr << "usage: retarget_driver <manifest> [--backward] [--eval] [--json]\n"; return 1; }
    std::string file = argv[1];
    bool backward = false, eval = false, json = false;
    for(int i=2;i<argc;++i){
        std::string a = argv[i];
        if(a == "--backward") backward = true;
        else if(a == "--eval") eval = true;
        else if(a == "--json") json = true;
        else { std::cerr << "unknown option: " << a << "\n"; return 1; }
    }
    std::string src;
    if(!read_file(file, src)){ std::cerr << "failed to read " << file << "\n"; return 1; }

    std::unique_ptr<text::Manifest> m;
    try { m = text::load_manifest(src, file); }
    catch(const RetargetError& e){ return report({e.diagnostic()}, json); }

    MetadataTypeLookup lookup(m->md);
    Replacer replacer(m->md, m->vars, lookup, m->origin, m->target);
    const Direction d = backward ? Direction::Backward : Direction::Forward;

    std::vector<Diagnostic> errors;
    for(auto& ne : m->exprs){
        ExprPtr out = replacer.try_rewrite(d, ne.expr, errors);
        if(!out){
            errors.back().notes.push_back(Note{"while rewriting expr '" + ne.name + "'", ne.line, -1});
            continue;
        }
        if(!json){
            std::cout << ne.name << ":\n";
            std::cout << "  " << (backward ? "target" : "origin") << ": " << to_string(m->md, m->vars, ne.expr) << "\n";
            std::cout << "  " << (backward ? "origin" : "target") << ": " << to_string(m->md, m->vars, out) << "\n";
        }
        if(!eval) continue;
        auto before = jit::evaluate(m->md, m->vars, ne.expr);
        auto after = jit::evaluate(m->md, m->vars, out);
        for(auto* r : {&before, &after})
            for(auto& e : r->errors) errors.push_back(e);
        if(before.success && after.success){
            if(!json) std::cout << "  value: " << before.value << " -> " << after.value << "\n";
            if(before.value != after.value)
                errors.push_back(Diagnostic{"E3006", "expr '" + ne.name + "' evaluates to " + std::to_string(before.value) +
                                            " before rewriting but " + std::to_string(after.value) + " after", "", ne.line, -1, {}});
        }
    }
    return report(errors, json);
}
