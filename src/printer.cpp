#include "retarget/printer.hpp"

#include <sstream>

namespace retarget
{

    std::string to_string(const Literal &l)
    {
        struct V
        {
            std::string operator()(std::monostate) const { return "nil"; }
            std::string operator()(bool b) const { return b ? "true" : "false"; }
            std::string operator()(int64_t i) const { return std::to_string(i); }
            std::string operator()(double d) const
            {
                std::ostringstream oss;
                oss << d;
                return oss.str();
            }
            std::string operator()(const std::string &s) const { return '"' + s + '"'; }
        };
        return std::visit(V{}, l);
    }

    std::string to_string(const Metadata &md, const VarPool &vars, const ExprPtr &e)
    {
        struct V
        {
            const Metadata &md;
            const VarPool &vars;

            std::string str(const ExprPtr &x) const { return x ? to_string(md, vars, x) : std::string("nil"); }
            std::string var(VarId v) const { return vars.at(v).name + "#" + std::to_string(v); }
            std::string mem(MemberId m) const
            {
                const Member &mm = md.member(m);
                std::string s = md.to_string(mm.declaring) + "::" + mm.name;
                if (!mm.generic_args.empty())
                {
                    s += "[";
                    for (size_t i = 0; i < mm.generic_args.size(); ++i)
                        s += (i ? "," : "") + md.to_string(mm.generic_args[i]);
                    s += "]";
                }
                return s;
            }
            std::string all(const std::vector<ExprPtr> &xs) const
            {
                std::string out;
                for (auto &x : xs)
                    out += ' ' + str(x);
                return out;
            }
            std::string target(const ExprPtr &obj) const { return obj ? " :on " + str(obj) : std::string(); }

            std::string operator()(const expr::Value &n) const { return "(value " + to_string(n.literal) + " " + md.to_string(n.type) + ")"; }
            std::string operator()(const expr::VarRef &n) const { return var(n.var); }
            std::string operator()(const expr::VarSet &n) const { return "(set! " + var(n.var) + " " + str(n.value) + ")"; }
            std::string operator()(const expr::Call &n) const { return "(call " + mem(n.method) + target(n.object) + all(n.args) + ")"; }
            std::string operator()(const expr::PropertyGet &n) const { return "(prop " + mem(n.property) + target(n.object) + all(n.index_args) + ")"; }
            std::string operator()(const expr::PropertySet &n) const
            {
                return "(prop-set " + mem(n.property) + target(n.object) + all(n.index_args) + " " + str(n.value) + ")";
            }
            std::string operator()(const expr::FieldGet &n) const { return "(field " + mem(n.field) + target(n.object) + ")"; }
            std::string operator()(const expr::FieldSet &n) const { return "(field-set " + mem(n.field) + target(n.object) + " " + str(n.value) + ")"; }
            std::string operator()(const expr::NewObject &n) const { return "(new " + md.to_string(md.member(n.ctor).declaring) + all(n.args) + ")"; }
            std::string operator()(const expr::Coerce &n) const { return "(coerce " + md.to_string(n.type) + " " + str(n.operand) + ")"; }
            std::string operator()(const expr::NewArray &n) const { return "(array " + md.to_string(n.element) + all(n.elems) + ")"; }
            std::string operator()(const expr::NewTuple &n) const { return "(tuple" + all(n.elems) + ")"; }
            std::string operator()(const expr::TupleGet &n) const { return "(item " + str(n.tuple) + " " + std::to_string(n.index) + ")"; }
            std::string operator()(const expr::NewDelegate &n) const
            {
                std::string ps;
                for (size_t i = 0; i < n.params.size(); ++i)
                    ps += (i ? " " : "") + var(n.params[i]);
                return "(delegate " + md.to_string(n.delegate_type) + " [" + ps + "] " + str(n.body) + ")";
            }
            std::string operator()(const expr::Let &n) const { return "(let [" + var(n.var) + " " + str(n.value) + "] " + str(n.body) + ")"; }
            std::string operator()(const expr::Lambda &n) const { return "(fn [" + var(n.param) + "] " + str(n.body) + ")"; }
            std::string operator()(const expr::Application &n) const { return "(apply " + str(n.func) + " " + str(n.arg) + ")"; }
            std::string operator()(const expr::NewUnionCase &n) const
            {
                return "(union " + md.to_string(n.union_case.union_type) + " " + md.union_case_info(n.union_case).name + all(n.args) + ")";
            }
            std::string operator()(const expr::NewRecord &n) const { return "(record " + md.to_string(n.record_type) + all(n.args) + ")"; }
            std::string operator()(const expr::UnionCaseTest &n) const
            {
                return "(union? " + str(n.operand) + " " + md.union_case_info(n.union_case).name + ")";
            }
            std::string operator()(const expr::Combination &n) const
            {
                const char *head = "do";
                switch (n.shape)
                {
                case Shape::IfThenElse: head = "if"; break;
                case Shape::Sequential: head = "do"; break;
                case Shape::WhileLoop: head = "while"; break;
                case Shape::TryFinally: head = "try-finally"; break;
                }
                return std::string("(") + head + all(n.operands) + ")";
            }
        };
        return std::visit(V{md, vars}, e->data);
    }

} // namespace retarget
