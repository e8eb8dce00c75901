//
// Template rendering engine
//
// Rendering happens in three steps: tokenize the source into text and tags,
// strip the lines of standalone block tags, parse the tokens into a node tree,
// then walk the tree against the context.
//

#include <quickform/renderer.hh>
#include <quickform/string_utils.hh>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <vector>

namespace quickform::templates {

namespace {

// ============================================================================
// Tokens
// ============================================================================

enum class tag_kind {
    variable,
    open_if,
    open_unless,
    open_each,
    else_branch,
    close,
    partial,
    comment
};

struct token {
    bool is_tag = false;
    tag_kind tag = tag_kind::variable;
    std::string content;    ///< Text, or the tag argument
    std::string block;      ///< Block name of a closing tag
    size_t line = 1;
};

size_t count_newlines(const std::string& text) {
    return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
}

bool is_blank(const std::string& text) {
    return std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return c == ' ' || c == '\t' || c == '\r'; });
}

token classify(const std::string& id, const std::string& inner, size_t line) {
    token t;
    t.is_tag = true;
    t.line = line;

    if (inner.empty()) {
        throw template_error::syntax(id, "empty tag '{{}}'", line);
    }

    switch (inner[0]) {
        case '!':
            t.tag = tag_kind::comment;
            return t;

        case '#': {
            std::string rest = trim(inner.substr(1));
            size_t space = rest.find_first_of(" \t");
            std::string word = rest.substr(0, space);
            t.content = space == std::string::npos ? "" : trim(rest.substr(space));

            if (word == "if") {
                t.tag = tag_kind::open_if;
            } else if (word == "unless") {
                t.tag = tag_kind::open_unless;
            } else if (word == "each") {
                t.tag = tag_kind::open_each;
            } else {
                throw template_error::syntax(id, "unknown block '{{#" + word + "}}'", line);
            }
            t.block = word;

            if (t.content.empty()) {
                throw template_error::syntax(id, "'{{#" + word + "}}' requires an argument", line);
            }
            return t;
        }

        case '/':
            t.tag = tag_kind::close;
            t.block = trim(inner.substr(1));
            return t;

        case '>':
            t.tag = tag_kind::partial;
            t.content = trim(inner.substr(1));
            if (t.content.empty()) {
                throw template_error::syntax(id, "partial tag without identifier", line);
            }
            return t;

        default:
            break;
    }

    if (inner == "else") {
        t.tag = tag_kind::else_branch;
        return t;
    }

    t.tag = tag_kind::variable;
    t.content = inner;
    return t;
}

std::vector<token> tokenize(const std::string& id, const std::string& source) {
    std::vector<token> tokens;
    size_t pos = 0;
    size_t line = 1;

    while (pos < source.size()) {
        size_t open = source.find("{{", pos);
        if (open == std::string::npos) {
            tokens.push_back(token{false, tag_kind::variable, source.substr(pos), "", line});
            break;
        }

        if (open > pos) {
            std::string text = source.substr(pos, open - pos);
            size_t newlines = count_newlines(text);
            tokens.push_back(token{false, tag_kind::variable, std::move(text), "", line});
            line += newlines;
        }

        size_t close = source.find("}}", open + 2);
        if (close == std::string::npos) {
            throw template_error::syntax(id, "unterminated '{{'", line);
        }

        std::string raw = source.substr(open + 2, close - open - 2);
        tokens.push_back(classify(id, trim(raw), line));
        line += count_newlines(raw);
        pos = close + 2;
    }

    return tokens;
}

// A block tag alone on its line takes the whole line with it
void strip_standalone_lines(std::vector<token>& tokens) {
    auto can_stand_alone = [](const token& t) {
        return t.is_tag && t.tag != tag_kind::variable;
    };

    // Decide on the original text first; trimming one tag's line must not
    // change the decision for its neighbour.
    std::vector<bool> standalone(tokens.size(), false);
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!can_stand_alone(tokens[i])) {
            continue;
        }

        bool left = true;
        if (i > 0) {
            const token& prev = tokens[i - 1];
            if (prev.is_tag) {
                left = false;
            } else {
                size_t nl = prev.content.rfind('\n');
                std::string tail = nl == std::string::npos ? prev.content : prev.content.substr(nl + 1);
                left = is_blank(tail) && (nl != std::string::npos || i - 1 == 0);
            }
        }

        bool right = true;
        if (i + 1 < tokens.size()) {
            const token& next = tokens[i + 1];
            if (next.is_tag) {
                right = false;
            } else {
                size_t nl = next.content.find('\n');
                std::string head = nl == std::string::npos ? next.content : next.content.substr(0, nl);
                right = is_blank(head) && (nl != std::string::npos || i + 1 == tokens.size() - 1);
            }
        }

        standalone[i] = left && right;
    }

    for (size_t i = 0; i < tokens.size(); ++i) {
        if (!standalone[i]) {
            continue;
        }
        if (i > 0 && !tokens[i - 1].is_tag) {
            std::string& text = tokens[i - 1].content;
            size_t nl = text.rfind('\n');
            text.erase(nl == std::string::npos ? 0 : nl + 1);
        }
        if (i + 1 < tokens.size() && !tokens[i + 1].is_tag) {
            std::string& text = tokens[i + 1].content;
            size_t nl = text.find('\n');
            text.erase(0, nl == std::string::npos ? text.size() : nl + 1);
        }
    }
}

// ============================================================================
// Node Tree
// ============================================================================

struct filter_call {
    std::string name;
    std::optional<std::string> arg;
    size_t columns = 0;         ///< indent only
};

struct condition {
    enum class op {
        truthy,
        equals,
        not_equals
    };

    std::string path;
    op compare = op::truthy;
    std::string literal;
};

struct node {
    enum class kind {
        text,
        variable,
        if_block,
        unless_block,
        each_block,
        partial
    };

    kind type = kind::text;
    std::string text;                   ///< Literal text, or partial identifier
    std::string path;                   ///< Variable or each path
    std::vector<filter_call> filters;
    condition cond;
    std::vector<node> body;
    std::vector<node> alternative;      ///< {{else}} branch
    size_t line = 1;
};

const char* const known_filters[] = {
    "upper", "lower", "pascal", "camel", "snake", "kebab", "plural", "join", "indent"
};

bool is_known_filter(const std::string& name) {
    return std::any_of(std::begin(known_filters), std::end(known_filters),
        [&](const char* f) { return name == f; });
}

std::optional<std::string> unquote(const std::string& text) {
    if (text.size() >= 2 && (text.front() == '"' || text.front() == '\'') && text.back() == text.front()) {
        return text.substr(1, text.size() - 2);
    }
    return std::nullopt;
}

bool is_path(const std::string& text) {
    return !text.empty() && std::none_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isspace(c) || c == '"' || c == '\'' || c == '|'; });
}

// Split on '|' outside quotes
std::vector<std::string> split_pipes(const std::string& text) {
    std::vector<std::string> parts;
    std::string current;
    char quote = 0;
    for (char c : text) {
        if (quote) {
            if (c == quote) quote = 0;
            current += c;
        } else if (c == '"' || c == '\'') {
            quote = c;
            current += c;
        } else if (c == '|') {
            parts.push_back(trim(current));
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(trim(current));
    return parts;
}

class parser {
public:
    parser(const std::string& id, const std::vector<token>& tokens)
        : id_(id), tokens_(tokens) {}

    std::vector<node> parse() {
        return parse_sequence(nullptr, 0, nullptr);
    }

private:
    const std::string& id_;
    const std::vector<token>& tokens_;
    size_t pos_ = 0;

    std::vector<node> parse_sequence(const std::string* block, size_t open_line,
                                     std::vector<node>* alternative) {
        std::vector<node> nodes;
        std::vector<node>* current = &nodes;
        bool in_else = false;

        while (pos_ < tokens_.size()) {
            const token& t = tokens_[pos_++];

            if (!t.is_tag) {
                if (!t.content.empty()) {
                    node n;
                    n.type = node::kind::text;
                    n.text = t.content;
                    n.line = t.line;
                    current->push_back(std::move(n));
                }
                continue;
            }

            switch (t.tag) {
                case tag_kind::comment:
                    break;

                case tag_kind::variable:
                    current->push_back(parse_variable(t));
                    break;

                case tag_kind::partial: {
                    node n;
                    n.type = node::kind::partial;
                    n.text = t.content;
                    n.line = t.line;
                    current->push_back(std::move(n));
                    break;
                }

                case tag_kind::open_if:
                case tag_kind::open_unless:
                case tag_kind::open_each:
                    current->push_back(parse_block(t));
                    break;

                case tag_kind::else_branch:
                    if (!block || in_else) {
                        throw template_error::syntax(id_, "unexpected '{{else}}'", t.line);
                    }
                    in_else = true;
                    current = alternative;
                    break;

                case tag_kind::close:
                    if (!block) {
                        throw template_error::syntax(id_,
                            "'{{/" + t.block + "}}' without matching opening tag", t.line);
                    }
                    if (t.block != *block) {
                        throw template_error::syntax(id_,
                            "'{{/" + t.block + "}}' closes '{{#" + *block + "}}' opened on line " +
                                std::to_string(open_line), t.line);
                    }
                    return nodes;
            }
        }

        if (block) {
            throw template_error::syntax(id_, "unclosed '{{#" + *block + "}}'", open_line);
        }
        return nodes;
    }

    node parse_block(const token& t) {
        node n;
        n.line = t.line;

        switch (t.tag) {
            case tag_kind::open_if:
                n.type = node::kind::if_block;
                n.cond = parse_condition(t);
                break;
            case tag_kind::open_unless:
                n.type = node::kind::unless_block;
                n.cond = parse_condition(t);
                break;
            default:
                n.type = node::kind::each_block;
                if (!is_path(t.content)) {
                    throw template_error::syntax(id_, "invalid path '" + t.content + "' in '{{#each}}'", t.line);
                }
                n.path = t.content;
                break;
        }

        n.body = parse_sequence(&t.block, t.line, &n.alternative);
        return n;
    }

    condition parse_condition(const token& t) {
        condition c;
        const std::string& arg = t.content;

        size_t eq_pos = arg.find("==");
        size_t ne_pos = arg.find("!=");
        size_t op_pos = std::min(eq_pos, ne_pos);
        condition::op op = op_pos == ne_pos ? condition::op::not_equals : condition::op::equals;

        if (op_pos == std::string::npos) {
            c.path = trim(arg);
        } else {
            c.path = trim(arg.substr(0, op_pos));
            c.compare = op;
            auto literal = unquote(trim(arg.substr(op_pos + 2)));
            if (!literal) {
                throw template_error::syntax(id_,
                    "expected a quoted literal after the comparison in '{{#" + t.block + " " + arg + "}}'",
                    t.line);
            }
            c.literal = *literal;
        }

        if (!is_path(c.path)) {
            throw template_error::syntax(id_, "invalid condition '" + arg + "'", t.line);
        }
        return c;
    }

    node parse_variable(const token& t) {
        node n;
        n.type = node::kind::variable;
        n.line = t.line;

        auto parts = split_pipes(t.content);
        n.path = parts[0];
        if (!is_path(n.path)) {
            throw template_error::syntax(id_, "invalid expression '" + t.content + "'", t.line);
        }

        for (size_t i = 1; i < parts.size(); ++i) {
            const std::string& filter_text = parts[i];
            filter_call f;
            size_t colon = filter_text.find(':');
            f.name = trim(filter_text.substr(0, colon));
            if (colon != std::string::npos) {
                std::string raw = trim(filter_text.substr(colon + 1));
                f.arg = unquote(raw).value_or(raw);
            }

            if (!is_known_filter(f.name)) {
                throw template_error::syntax(id_, "unknown filter '" + f.name + "'", t.line);
            }
            if (f.name == "indent") {
                if (!f.arg || f.arg->empty() ||
                    !std::all_of(f.arg->begin(), f.arg->end(), [](unsigned char c) { return std::isdigit(c); })) {
                    throw template_error::syntax(id_, "filter 'indent' requires a column count", t.line);
                }
                auto parsed = std::from_chars(f.arg->data(), f.arg->data() + f.arg->size(), f.columns);
                if (parsed.ec != std::errc() || f.columns > Renderer::max_indent) {
                    throw template_error::syntax(id_, "filter 'indent' column count '" + *f.arg +
                        "' exceeds " + std::to_string(Renderer::max_indent), t.line);
                }
            }
            n.filters.push_back(std::move(f));
        }
        return n;
    }
};

std::vector<node> compile(const std::string& id, const std::string& source) {
    auto tokens = tokenize(id, source);
    strip_standalone_lines(tokens);
    return parser(id, tokens).parse();
}

// ============================================================================
// Evaluation
// ============================================================================

struct frame {
    const value* item;
    bool is_loop = false;
    size_t index = 0;
    size_t count = 0;
    std::string key;
};

class evaluator {
public:
    evaluator(const Renderer::partial_loader& loader, std::string& out)
        : loader_(loader), out_(out) {}

    void run(const std::string& id, const std::vector<node>& nodes, const value& root) {
        scopes_.push_back(frame{&root});
        render_nodes(id, nodes, 0);
    }

private:
    const Renderer::partial_loader& loader_;
    std::string& out_;
    std::vector<frame> scopes_;

    const frame* innermost_loop() const {
        for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
            if (it->is_loop) {
                return &*it;
            }
        }
        return nullptr;
    }

    value lookup(const std::string& id, const std::string& path, size_t line) const {
        if (path[0] == '@') {
            const frame* loop = innermost_loop();
            if (loop) {
                if (path == "@index") return value(static_cast<std::int64_t>(loop->index));
                if (path == "@first") return value(loop->index == 0);
                if (path == "@last") return value(loop->index + 1 == loop->count);
                if (path == "@key" && !loop->key.empty()) return value(loop->key);
            }
            throw template_error::undefined_path(id, path, line);
        }

        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            size_t dot = path.find('.', start);
            segments.push_back(path.substr(start, dot - start));
            if (dot == std::string::npos) break;
            start = dot + 1;
        }

        const value* current = nullptr;
        size_t next = 1;

        if (segments[0] == "this") {
            current = scopes_.back().item;
        } else {
            for (auto it = scopes_.rbegin(); it != scopes_.rend() && !current; ++it) {
                current = it->item->find(segments[0]);
            }
        }

        for (; current && next < segments.size(); ++next) {
            const std::string& segment = segments[next];
            if (current->is_map()) {
                current = current->find(segment);
            } else if (current->is_list() && !segment.empty() &&
                       std::all_of(segment.begin(), segment.end(), [](unsigned char c) { return std::isdigit(c); })) {
                // Indices too large for size_t are simply out of range
                size_t index = 0;
                auto parsed = std::from_chars(segment.data(), segment.data() + segment.size(), index);
                const auto& items = current->as_list();
                current = parsed.ec == std::errc() && index < items.size() ? &items[index] : nullptr;
            } else {
                current = nullptr;
            }
        }

        if (!current) {
            throw template_error::undefined_path(id, path, line);
        }
        return *current;
    }

    [[noreturn]] static void fail(const std::string& id, size_t line, const std::string& detail) {
        throw template_error(id, "line " + std::to_string(line) + ": " + detail);
    }

    value apply_filter(const std::string& id, const node& n, const value& input, const filter_call& f) const {
        if (f.name == "join") {
            if (!input.is_list()) {
                fail(id, n.line, "filter 'join' expects a list at '" + n.path + "'");
            }
            std::vector<std::string> parts;
            for (const auto& item : input.as_list()) {
                if (!item.is_scalar()) {
                    fail(id, n.line, "filter 'join' expects a list of scalars at '" + n.path + "'");
                }
                parts.push_back(item.text());
            }
            return value(join(parts, f.arg.value_or(", ")));
        }

        if (!input.is_scalar()) {
            fail(id, n.line, "filter '" + f.name + "' expects a scalar at '" + n.path + "'");
        }
        const std::string text = input.text();

        if (f.name == "upper") return value(to_upper(text));
        if (f.name == "lower") return value(to_lower(text));
        if (f.name == "pascal") return value(to_pascal_case(text));
        if (f.name == "camel") return value(to_camel_case(text));
        if (f.name == "snake") return value(to_snake_case(text));
        if (f.name == "kebab") return value(to_kebab_case(text));
        if (f.name == "plural") return value(pluralize(text));
        if (f.name == "indent") return value(indent_lines(text, f.columns));

        fail(id, n.line, "unknown filter '" + f.name + "'");
    }

    bool evaluate(const std::string& id, const node& n) const {
        value v = lookup(id, n.cond.path, n.line);
        switch (n.cond.compare) {
            case condition::op::truthy:
                return v.truthy();
            case condition::op::equals:
            case condition::op::not_equals: {
                if (!v.is_scalar()) {
                    fail(id, n.line, "cannot compare non-scalar '" + n.cond.path + "'");
                }
                bool same = v.text() == n.cond.literal;
                return n.cond.compare == condition::op::equals ? same : !same;
            }
        }
        return false;
    }

    void render_nodes(const std::string& id, const std::vector<node>& nodes, size_t depth) {
        for (const auto& n : nodes) {
            render_node(id, n, depth);
        }
    }

    void render_node(const std::string& id, const node& n, size_t depth) {
        switch (n.type) {
            case node::kind::text:
                out_ += n.text;
                break;

            case node::kind::variable: {
                value v = lookup(id, n.path, n.line);
                for (const auto& f : n.filters) {
                    v = apply_filter(id, n, v, f);
                }
                if (v.is_list()) {
                    fail(id, n.line, "'" + n.path + "' is a list; use the join filter");
                }
                if (v.is_map()) {
                    fail(id, n.line, "'" + n.path + "' is a map and cannot be rendered");
                }
                out_ += v.text();
                break;
            }

            case node::kind::if_block:
                render_nodes(id, evaluate(id, n) ? n.body : n.alternative, depth);
                break;

            case node::kind::unless_block:
                render_nodes(id, evaluate(id, n) ? n.alternative : n.body, depth);
                break;

            case node::kind::each_block:
                render_each(id, n, depth);
                break;

            case node::kind::partial:
                render_partial(id, n, depth);
                break;
        }
    }

    void render_each(const std::string& id, const node& n, size_t depth) {
        // Local copy keeps the shared list storage alive during the loop
        const value collection = lookup(id, n.path, n.line);

        if (collection.is_list() && !collection.as_list().empty()) {
            const auto& items = collection.as_list();
            for (size_t i = 0; i < items.size(); ++i) {
                scopes_.push_back(frame{&items[i], true, i, items.size(), {}});
                render_nodes(id, n.body, depth);
                scopes_.pop_back();
            }
            return;
        }

        if (collection.is_map() && !collection.as_map().empty()) {
            const auto& entries = collection.as_map();
            for (size_t i = 0; i < entries.size(); ++i) {
                scopes_.push_back(frame{&entries[i].second, true, i, entries.size(), entries[i].first});
                render_nodes(id, n.body, depth);
                scopes_.pop_back();
            }
            return;
        }

        if (collection.truthy() && collection.is_scalar()) {
            fail(id, n.line, "cannot iterate over scalar '" + n.path + "'");
        }
        render_nodes(id, n.alternative, depth);
    }

    void render_partial(const std::string& id, const node& n, size_t depth) {
        if (depth + 1 > Renderer::max_partial_depth) {
            fail(id, n.line, "partials nested deeper than " +
                std::to_string(Renderer::max_partial_depth) + " at '{{> " + n.text + "}}'");
        }
        if (!loader_) {
            fail(id, n.line, "no partial loader for '{{> " + n.text + "}}'");
        }

        const std::string& source = loader_(n.text);
        auto nodes = compile(n.text, source);
        render_nodes(n.text, nodes, depth + 1);
    }
};

} // anonymous namespace

// ============================================================================
// Renderer
// ============================================================================

Renderer::Renderer(partial_loader loader)
    : loader_(std::move(loader)) {}

std::string Renderer::render(const std::string& template_id,
                             const std::string& source,
                             const value& context) const {
    auto nodes = compile(template_id, source);

    std::string out;
    out.reserve(source.size());
    evaluator(loader_, out).run(template_id, nodes, context);
    return out;
}

void Renderer::check_syntax(const std::string& template_id, const std::string& source) const {
    compile(template_id, source);
}

} // namespace quickform::templates
