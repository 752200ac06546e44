#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <array>
#include <variant>
#include <optional>
#include <stdexcept>
#include <functional>
#include <utility>
#include <cctype>
#include <cstdint>
#include <algorithm>
#include <fmt/format.h>

// A small evaluator for Go text/template syntax: text, {{ actions }}, field
// chains (.Env.KEY), string/number literals, function calls, pipelines,
// comments and trim markers. Error texts match the Go engine byte for byte.

namespace crossforge::tmpl {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using EnvMap = std::map<std::string, std::string>;

// The fixed set of names reachable from a template
struct Fields {
    std::string project_name;
    std::string version;
    std::string tag;
    std::string commit;
    std::string full_commit;
    std::string short_commit;
    std::string major;
    std::string minor;
    std::string patch;
    std::string date;
    std::string timestamp;
    std::string os;
    std::string arch;
    std::string arm;
    std::string binary;
    std::string artifact_name;
    EnvMap env;

    static const auto& table() {
        static const std::array<std::pair<std::string_view, std::string Fields::*>, 16> names = {{
            {"ArtifactName", &Fields::artifact_name},
            {"Arch", &Fields::arch},
            {"Arm", &Fields::arm},
            {"Binary", &Fields::binary},
            {"Commit", &Fields::commit},
            {"Date", &Fields::date},
            {"FullCommit", &Fields::full_commit},
            {"Major", &Fields::major},
            {"Minor", &Fields::minor},
            {"Os", &Fields::os},
            {"Patch", &Fields::patch},
            {"ProjectName", &Fields::project_name},
            {"ShortCommit", &Fields::short_commit},
            {"Tag", &Fields::tag},
            {"Timestamp", &Fields::timestamp},
            {"Version", &Fields::version},
        }};
        return names;
    }
};

// A value produced while executing: a string, a string map, or the root
using Value = std::variant<std::string, const EnvMap*, const Fields*>;

// Functions take only strings; `arity` is checked before the call
struct Function {
    size_t arity;
    std::function<std::string(const std::vector<std::string>&)> fn;
};
using FuncMap = std::map<std::string, Function, std::less<>>;

namespace detail {

inline constexpr std::string_view NAME = "tmpl";

enum class ItemType { Error, Eof, Text, LeftDelim, RightDelim, Space, Pipe, Dot, Field, Identifier, String, RawString, Number, Char };

struct Item {
    ItemType type;
    std::string val;
    size_t pos;
};

// Go's %q
inline std::string quote(const std::string_view s) {
    std::string out = "\"";
    for (const char ch : s) {
        const auto c = static_cast<unsigned char>(ch);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            case '\r': out += "\\r"; break;
            default:
                if (c < 0x20 || c == 0x7f) out += fmt::format("\\x{:02x}", c);
                else out += ch;
        }
    }
    out += '"';
    return out;
}

inline std::string item_string(const Item& item) {
    switch (item.type) {
        case ItemType::Eof: return "EOF";
        case ItemType::Error: return item.val;
        default: break;
    }
    if (item.val.size() > 10) return quote(item.val.substr(0, 10)) + "...";
    return quote(item.val);
}

// Go's %#U for one UTF-8 sequence starting at s[0]
inline std::string describe_rune(const std::string_view s, size_t& len) {
    const auto b0 = static_cast<unsigned char>(s[0]);
    uint32_t cp = b0;
    len = 1;
    if (b0 >= 0xf0 && s.size() >= 4) { cp = b0 & 0x07; len = 4; }
    else if (b0 >= 0xe0 && s.size() >= 3) { cp = b0 & 0x0f; len = 3; }
    else if (b0 >= 0xc0 && s.size() >= 2) { cp = b0 & 0x1f; len = 2; }
    for (size_t k = 1; k < len; ++k) {
        cp = (cp << 6) | (static_cast<unsigned char>(s[k]) & 0x3f);
    }
    if (cp < 0x20 || cp == 0x7f) return fmt::format("U+{:04X}", cp);
    return fmt::format("U+{:04X} '{}'", cp, s.substr(0, len));
}

class Lexer {
public:
    explicit Lexer(const std::string_view input) : input_(input) {}

    std::vector<Item> run() {
        while (lex_text() && lex_action()) {}
        return std::move(items_);
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
    std::vector<Item> items_;

    static bool is_space(const char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
    static bool is_alnum(const char c) { return std::isalnum(static_cast<unsigned char>(c)) || c == '_'; }

    bool at(const std::string_view s) const { return input_.substr(pos_).starts_with(s); }

    bool at_left_trim() const {
        return pos_ + 1 < input_.size() && input_[pos_] == '-' && is_space(input_[pos_ + 1]);
    }

    bool at_right_trim() const {
        return pos_ + 3 < input_.size() && is_space(input_[pos_]) && input_.substr(pos_ + 1).starts_with("-}}");
    }

    void emit(const ItemType type, const size_t start) {
        items_.push_back({type, std::string(input_.substr(start, pos_ - start)), start});
    }

    bool error(std::string message) {
        items_.push_back({ItemType::Error, std::move(message), pos_});
        return false;
    }

    // Go treats these as the end of a field or identifier
    bool at_terminator() const {
        if (pos_ >= input_.size()) return true;
        switch (const char c = input_[pos_]) {
            case '.': case ',': case '|': case ':': case ')': case '(': case '}':
                return true;
            default:
                return is_space(c);
        }
    }

    void skip_space() {
        while (pos_ < input_.size() && is_space(input_[pos_])) ++pos_;
    }

    bool lex_text() {
        const size_t start = pos_;
        const size_t delim = input_.find("{{", pos_);
        if (delim == std::string_view::npos) {
            pos_ = input_.size();
            if (pos_ > start) emit(ItemType::Text, start);
            items_.push_back({ItemType::Eof, "", pos_});
            return false;
        }
        size_t text_end = delim;
        pos_ = delim + 2;
        if (at_left_trim()) {
            while (text_end > start && is_space(input_[text_end - 1])) --text_end;
        }
        if (text_end > start) {
            items_.push_back({ItemType::Text, std::string(input_.substr(start, text_end - start)), start});
        }
        pos_ = delim;
        return true;
    }

    // Consumes the closing delimiter; false when the action has to continue
    bool lex_right_delim() {
        if (at_right_trim()) {
            const size_t start = pos_ + 2;
            pos_ += 4;
            items_.push_back({ItemType::RightDelim, "}}", start});
            skip_space();
            return true;
        }
        if (at("}}")) {
            const size_t start = pos_;
            pos_ += 2;
            emit(ItemType::RightDelim, start);
            return true;
        }
        return false;
    }

    bool lex_comment() {
        const size_t end = input_.find("*/", pos_ + 2);
        if (end == std::string_view::npos) {
            return error("unclosed comment");
        }
        pos_ = end + 2;
        if (at_right_trim()) {
            pos_ += 4;
            skip_space();
            return true;
        }
        if (at("}}")) {
            pos_ += 2;
            return true;
        }
        return error("comment ends before closing delimiter");
    }

    bool lex_action() {
        const size_t start = pos_;
        pos_ += 2;
        if (at_left_trim()) pos_ += 2;
        if (at("/*")) return lex_comment();
        items_.push_back({ItemType::LeftDelim, "{{", start});

        while (true) {
            if (lex_right_delim()) return true;
            if (pos_ >= input_.size()) return error("unclosed action");

            const size_t token_start = pos_;
            const char c = input_[pos_];

            if (is_space(c)) {
                skip_space();
                // the last space belongs to a " -}}" trim marker
                if (input_.substr(pos_).starts_with("-}}")) --pos_;
                if (pos_ > token_start) emit(ItemType::Space, token_start);
            } else if (c == '|') {
                ++pos_;
                emit(ItemType::Pipe, token_start);
            } else if (c == '"') {
                ++pos_;
                while (true) {
                    if (pos_ >= input_.size() || input_[pos_] == '\n') return error("unterminated quoted string");
                    if (input_[pos_] == '\\') {
                        ++pos_;
                        if (pos_ >= input_.size() || input_[pos_] == '\n') return error("unterminated quoted string");
                    } else if (input_[pos_] == '"') {
                        ++pos_;
                        break;
                    }
                    ++pos_;
                }
                emit(ItemType::String, token_start);
            } else if (c == '`') {
                const size_t end = input_.find('`', pos_ + 1);
                if (end == std::string_view::npos) return error("unterminated raw quoted string");
                pos_ = end + 1;
                emit(ItemType::RawString, token_start);
            } else if (c == '.' && !(pos_ + 1 < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_ + 1])))) {
                ++pos_;
                if (at_terminator()) {
                    emit(ItemType::Dot, token_start);
                    continue;
                }
                while (pos_ < input_.size() && is_alnum(input_[pos_])) ++pos_;
                if (!at_terminator()) {
                    size_t len = 0;
                    return error("bad character " + describe_rune(input_.substr(pos_), len));
                }
                emit(ItemType::Field, token_start);
            } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
                while (pos_ < input_.size() && is_alnum(input_[pos_])) ++pos_;
                if (!at_terminator()) {
                    size_t len = 0;
                    return error("bad character " + describe_rune(input_.substr(pos_), len));
                }
                emit(ItemType::Identifier, token_start);
            } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' ||
                       ((c == '-' || c == '+') && pos_ + 1 < input_.size() && std::isdigit(static_cast<unsigned char>(input_[pos_ + 1])))) {
                ++pos_;
                while (pos_ < input_.size() && (std::isdigit(static_cast<unsigned char>(input_[pos_])) || input_[pos_] == '.')) ++pos_;
                if (pos_ < input_.size() && is_alnum(input_[pos_])) {
                    while (pos_ < input_.size() && is_alnum(input_[pos_])) ++pos_;
                    return error("bad number syntax: " + quote(input_.substr(token_start, pos_ - token_start)));
                }
                emit(ItemType::Number, token_start);
            } else if (static_cast<unsigned char>(c) < 0x80 && std::isprint(static_cast<unsigned char>(c))) {
                ++pos_;
                emit(ItemType::Char, token_start);
            } else {
                size_t len = 0;
                return error("unrecognized character in action: " + describe_rune(input_.substr(pos_), len));
            }
        }
    }
};

enum class NodeType { Dot, Field, Identifier, String, Number };

struct ArgNode {
    NodeType type;
    size_t pos;
    std::string text;                // as written, used in error context
    std::vector<std::string> idents; // field chain, without dots
    std::string value;               // unquoted literal
};

struct CommandNode {
    std::vector<ArgNode> args;
};

struct ActionNode {
    std::vector<CommandNode> cmds;
};

struct TextNode {
    std::string text;
};

using Node = std::variant<TextNode, ActionNode>;

// Go's strconv.Unquote for "..." literals
inline std::optional<std::string> unquote(const std::string_view quoted) {
    std::string out;
    for (size_t i = 1; i + 1 < quoted.size(); ++i) {
        if (quoted[i] != '\\') {
            out += quoted[i];
            continue;
        }
        if (++i + 1 >= quoted.size()) return std::nullopt;
        switch (quoted[i]) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'a': out += '\a'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case '\\': out += '\\'; break;
            case '"': out += '"'; break;
            case 'x': {
                if (i + 2 >= quoted.size() - 1) return std::nullopt;
                const std::string hex(quoted.substr(i + 1, 2));
                if (!std::isxdigit(static_cast<unsigned char>(hex[0])) || !std::isxdigit(static_cast<unsigned char>(hex[1]))) {
                    return std::nullopt;
                }
                out += static_cast<char>(std::stoi(hex, nullptr, 16));
                i += 2;
                break;
            }
            default:
                return std::nullopt;
        }
    }
    return out;
}

class Parser {
public:
    Parser(const std::string_view text, const FuncMap& funcs) : text_(text), funcs_(funcs) {}

    std::vector<Node> parse() {
        items_ = Lexer(text_).run();
        std::vector<Node> nodes;
        while (true) {
            const Item& item = next();
            switch (item.type) {
                case ItemType::Eof:
                    return nodes;
                case ItemType::Text:
                    nodes.emplace_back(TextNode{item.val});
                    break;
                case ItemType::LeftDelim:
                    nodes.emplace_back(action());
                    break;
                case ItemType::Error:
                    fail(item.val);
                default:
                    unexpected(item, "input");
            }
        }
    }

private:
    std::string_view text_;
    const FuncMap& funcs_;
    std::vector<Item> items_;
    size_t index_ = 0;
    size_t last_pos_ = 0;

    const Item& next() {
        const Item& item = items_[std::min(index_, items_.size() - 1)];
        ++index_;
        last_pos_ = item.pos;
        return item;
    }

    void backup() { --index_; }

    const Item& peek() const { return items_[std::min(index_, items_.size() - 1)]; }

    const Item& next_non_space() {
        while (peek().type == ItemType::Space) next();
        return next();
    }

    const Item& peek_non_space() {
        while (peek().type == ItemType::Space) next();
        return peek();
    }

    size_t line_of(const size_t pos) const {
        return 1 + static_cast<size_t>(std::count(text_.begin(), text_.begin() + std::min(pos, text_.size()), '\n'));
    }

    [[noreturn]] void fail(const std::string_view message) const {
        throw Error(fmt::format("template: {}:{}: {}", NAME, line_of(last_pos_), message));
    }

    [[noreturn]] void unexpected(const Item& item, const std::string_view context) const {
        if (item.type == ItemType::Error) fail(item.val);
        fail(fmt::format("unexpected {} in {}", item_string(item), context));
    }

    ActionNode action() {
        ActionNode node;
        while (true) {
            const Item& token = next_non_space();
            switch (token.type) {
                case ItemType::RightDelim:
                    check_pipeline(node);
                    return node;
                case ItemType::Dot:
                case ItemType::Field:
                case ItemType::Identifier:
                case ItemType::String:
                case ItemType::RawString:
                case ItemType::Number:
                    backup();
                    node.cmds.push_back(command());
                    break;
                default:
                    unexpected(token, "command");
            }
        }
    }

    void check_pipeline(const ActionNode& node) const {
        if (node.cmds.empty()) fail("missing value for command");
        for (size_t i = 1; i < node.cmds.size(); ++i) {
            switch (node.cmds[i].args.front().type) {
                case NodeType::Dot:
                case NodeType::String:
                case NodeType::Number:
                    fail(fmt::format("non executable command in pipeline stage {}", i + 1));
                default:
                    break;
            }
        }
    }

    CommandNode command() {
        CommandNode cmd;
        while (true) {
            peek_non_space();
            if (auto arg = operand()) {
                cmd.args.push_back(std::move(*arg));
            }
            const Item& token = next();
            if (token.type == ItemType::Space) continue;
            if (token.type == ItemType::RightDelim) {
                backup();
            } else if (token.type != ItemType::Pipe) {
                unexpected(token, "operand");
            }
            break;
        }
        if (cmd.args.empty()) fail("empty command");
        return cmd;
    }

    std::optional<ArgNode> operand() {
        auto node = term();
        if (!node) return std::nullopt;
        if (peek().type == ItemType::Field) {
            const size_t chain_pos = peek().pos;
            if (node->type != NodeType::Field) {
                fail(fmt::format("unexpected . after term {}", quote(node->text)));
            }
            while (peek().type == ItemType::Field) {
                const Item& field = next();
                node->text += field.val;
                node->idents.push_back(field.val.substr(1));
            }
            node->pos = chain_pos;
        }
        return node;
    }

    std::optional<ArgNode> term() {
        const Item& token = next_non_space();
        switch (token.type) {
            case ItemType::Identifier:
                if (!funcs_.contains(token.val)) {
                    fail(fmt::format("function {} not defined", quote(token.val)));
                }
                return ArgNode{NodeType::Identifier, token.pos, token.val, {}, token.val};
            case ItemType::Dot:
                return ArgNode{NodeType::Dot, token.pos, ".", {}, ""};
            case ItemType::Field:
                return ArgNode{NodeType::Field, token.pos, token.val, {token.val.substr(1)}, ""};
            case ItemType::Number:
                return ArgNode{NodeType::Number, token.pos, token.val, {}, token.val};
            case ItemType::String: {
                auto value = unquote(token.val);
                if (!value) fail("invalid syntax");
                return ArgNode{NodeType::String, token.pos, token.val, {}, std::move(*value)};
            }
            case ItemType::RawString:
                return ArgNode{NodeType::String, token.pos, token.val, {}, token.val.substr(1, token.val.size() - 2)};
            default:
                backup();
                return std::nullopt;
        }
    }
};

class Executor {
public:
    Executor(const std::string_view text, const FuncMap& funcs, const Fields& data)
        : text_(text), funcs_(funcs), data_(data) {}

    std::string run(const std::vector<Node>& nodes) const {
        std::string out;
        for (const auto& node : nodes) {
            if (const auto* text = std::get_if<TextNode>(&node)) {
                out += text->text;
            } else {
                out += print(eval_pipeline(std::get<ActionNode>(node)));
            }
        }
        return out;
    }

private:
    std::string_view text_;
    const FuncMap& funcs_;
    const Fields& data_;

    static std::string print_map(const EnvMap& map) {
        std::string out = "map[";
        bool first = true;
        for (const auto& [key, value] : map) {
            if (!first) out += ' ';
            out += fmt::format("{}:{}", key, value);
            first = false;
        }
        return out + "]";
    }

    std::string print(const Value& value) const {
        if (const auto* s = std::get_if<std::string>(&value)) return *s;
        if (const auto* map = std::get_if<const EnvMap*>(&value)) return print_map(**map);
        // Root: keys sorted the way Go prints a map
        EnvMap all;
        for (const auto& [name, member] : Fields::table()) all.emplace(name, data_.*member);
        all.emplace("Env", print_map(data_.env));
        return print_map(all);
    }

    static std::string type_name(const Value& value) {
        if (std::holds_alternative<std::string>(value)) return "string";
        if (std::holds_alternative<const EnvMap*>(value)) return "map[string]string";
        return "map[string]interface {}";
    }

    [[noreturn]] void fail(const ArgNode& at, const std::string_view message) const {
        const size_t pos = std::min(at.pos, text_.size());
        const std::string_view before = text_.substr(0, pos);
        const size_t line = 1 + static_cast<size_t>(std::count(before.begin(), before.end(), '\n'));
        const size_t last_newline = before.rfind('\n');
        const size_t column = last_newline == std::string_view::npos ? pos : pos - last_newline - 1;
        std::string context = at.text;
        if (context.size() > 20) context = context.substr(0, 20) + "...";
        throw Error(fmt::format("template: {}:{}:{}: executing \"{}\" at <{}>: {}",
                                NAME, line, column, NAME, context, message));
    }

    Value eval_field(const ArgNode& node) const {
        Value current{&data_};
        for (const auto& ident : node.idents) {
            if (std::holds_alternative<const Fields*>(current)) {
                if (ident == "Env") {
                    current = &data_.env;
                    continue;
                }
                const auto& names = Fields::table();
                const auto it = std::ranges::find_if(names, [&](const auto& entry) { return entry.first == ident; });
                if (it == names.end()) fail(node, fmt::format("map has no entry for key {}", quote(ident)));
                current = data_.*(it->second);
            } else if (const auto* map = std::get_if<const EnvMap*>(&current)) {
                const auto it = (*map)->find(ident);
                if (it == (*map)->end()) fail(node, fmt::format("map has no entry for key {}", quote(ident)));
                current = it->second;
            } else {
                fail(node, fmt::format("can't evaluate field {} in type string", ident));
            }
        }
        return current;
    }

    std::string eval_string_arg(const ArgNode& arg) const {
        Value value;
        switch (arg.type) {
            case NodeType::Field: value = eval_field(arg); break;
            case NodeType::Dot: value = &data_; break;
            case NodeType::Identifier: value = call(arg, {}, std::nullopt); break;
            default: return arg.value;
        }
        if (const auto* s = std::get_if<std::string>(&value)) return *s;
        fail(arg, fmt::format("wrong type for value; expected string; got {}", type_name(value)));
    }

    Value call(const ArgNode& ident, const std::vector<ArgNode>& args, const std::optional<Value>& final) const {
        const auto& function = funcs_.find(ident.value)->second;
        std::vector<std::string> argv;
        for (const auto& arg : args) argv.push_back(eval_string_arg(arg));
        if (final) {
            const auto* s = std::get_if<std::string>(&*final);
            if (!s) fail(ident, fmt::format("wrong type for value; expected string; got {}", type_name(*final)));
            argv.push_back(*s);
        }
        if (argv.size() != function.arity) {
            fail(ident, fmt::format("wrong number of args for {}: want {} got {}", ident.value, function.arity, argv.size()));
        }
        return function.fn(argv);
    }

    Value eval_command(const CommandNode& cmd, const std::optional<Value>& final) const {
        const ArgNode& first = cmd.args.front();
        const bool has_args = cmd.args.size() > 1 || final.has_value();
        switch (first.type) {
            case NodeType::Identifier:
                return call(first, std::vector<ArgNode>(cmd.args.begin() + 1, cmd.args.end()), final);
            case NodeType::Field:
                if (has_args) fail(first, fmt::format("{} is not a method but has arguments", first.idents.back()));
                return eval_field(first);
            default:
                if (has_args) fail(first, fmt::format("can't give argument to non-function {}", first.text));
                if (first.type == NodeType::Dot) return Value{&data_};
                return first.value;
        }
    }

    Value eval_pipeline(const ActionNode& action) const {
        std::optional<Value> final;
        for (const auto& cmd : action.cmds) {
            final = eval_command(cmd, final);
        }
        return *final;
    }
};

} // namespace detail

// Parses and executes `text` against `data` in one go. Throws tmpl::Error.
inline std::string execute(const std::string_view text, const FuncMap& funcs, const Fields& data) {
    const auto nodes = detail::Parser(text, funcs).parse();
    return detail::Executor(text, funcs, data).run(nodes);
}

} // namespace crossforge::tmpl
