#include "retarget/diagnostics_json.hpp"
#include <sstream>
#include <cstdlib>
#include <cstdio>

namespace retarget {

std::string json_escape(const std::string& s){
    std::ostringstream o; o<<'"';
    for(char c: s){
        switch(c){
            case '"': o<<"\\\""; break; case '\\': o<<"\\\\"; break;
            case '\n': o<<"\\n"; break; case '\r': o<<"\\r"; break; case '\t': o<<"\\t"; break;
            default:
                if(static_cast<unsigned char>(c) < 0x20){ char buf[7]; std::snprintf(buf,sizeof(buf),"\\u%04X", (unsigned char)c); o<<buf; }
                else { o<<c; }
                break;
        }
    }
    o<<'"';
    return o.str();
}

std::string diagnostic_to_json(const Diagnostic& d){
    std::ostringstream os;
    os<<"{\"code\":"<<json_escape(d.code)
      <<",\"message\":"<<json_escape(d.message)
      <<",\"hint\":"<<json_escape(d.hint)
      <<",\"line\":"<<d.line
      <<",\"col\":"<<d.col
      <<",\"notes\":[";
    for(size_t i=0;i<d.notes.size(); ++i){
        if(i) os<<",";
        os<<"{\"message\":"<<json_escape(d.notes[i].message)<<",\"line\":"<<d.notes[i].line<<",\"col\":"<<d.notes[i].col<<"}";
    }
    os<<"]}";
    return os.str();
}

std::string diagnostics_to_json(const std::vector<Diagnostic>& ds){
    std::ostringstream os;
    os<<"{\"success\":"<<(ds.empty()?"true":"false")<<",\"errors\":[";
    for(size_t i=0;i<ds.size(); ++i){ if(i) os<<","; os<<diagnostic_to_json(ds[i]); }
    os<<"]}";
    return os.str();
}

std::string format_diagnostic(const Diagnostic& d){
    std::ostringstream os;
    os<<"error["<<d.code<<"]: "<<d.message;
    if(d.line>=0) os<<" (line "<<d.line<<", col "<<d.col<<")";
    os<<"\n";
    if(!d.hint.empty()) os<<"  hint: "<<d.hint<<"\n";
    for(const auto& n: d.notes) os<<"  note: "<<n.message<<"\n";
    return os.str();
}

void maybe_print_json(const std::vector<Diagnostic>& ds){
    if(const char* env = std::getenv("RETARGET_DIAG_JSON")){
        if(env[0]=='1'){
            auto js=diagnostics_to_json(ds);
            std::fprintf(stderr, "%s\n", js.c_str());
        }
    }
}

} // namespace retarget
