// EDN reader for rule sources. Nodes keep their 1-based source position so rule
// errors can point at the offending form.
#pragma once
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace infrar::edn
{

    struct parse_error : std::runtime_error
    {
        parse_error(const std::string &msg, int line, int col)
            : std::runtime_error(msg + " (line " + std::to_string(line) + ":" + std::to_string(col) + ")"), line(line), col(col) {}
        int line;
        int col;
    };

    struct node;
    using node_ptr = std::shared_ptr<node>;

    struct keyword
    {
        std::string name;
    };
    struct symbol
    {
        std::string name;
    };
    // Vector `[...]` or list `(...)`; rule sources treat both as sequences.
    struct seq
    {
        std::vector<node_ptr> elems;
        bool list = false;
    };
    struct map
    {
        std::vector<std::pair<node_ptr, node_ptr>> entries;
    };

    using node_data = std::variant<std::monostate, bool, int64_t, double, std::string, keyword, symbol, seq, map>;

    struct node
    {
        node_data data;
        int line = -1;
        int col = -1;
    };

    namespace detail
    {
        class reader
        {
        public:
            explicit reader(std::string_view text) : text_(text) {}

            node_ptr read_form()
            {
                skip_blank();
                const int l = line_, c = col_;
                if (at_end())
                    fail("unexpected end of input");
                const char ch = peek();
                if (ch == '"')
                    return read_string();
                if (ch == '[' || ch == '(' || ch == '{')
                {
                    advance();
                    return read_collection(ch, l, c);
                }
                if (ch == '#')
                    throw parse_error("sets and tagged values are not supported in rule sources", l, c);
                if (digit(ch) || ((ch == '-' || ch == '+') && digit(peek(1))))
                    return read_number();
                if (ch == ':' || word_start(ch))
                    return read_word();
                fail(std::string("unexpected character '") + ch + "'");
            }

            // Commas count as whitespace; ';' comments run to end of line.
            void skip_blank()
            {
                while (!at_end())
                {
                    const char ch = peek();
                    if (ch == ';')
                    {
                        while (!at_end() && advance() != '\n')
                        {
                        }
                    }
                    else if (ch == ',' || ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v')
                        advance();
                    else
                        return;
                }
            }

            bool at_end() const { return pos_ >= text_.size(); }
            [[noreturn]] void fail(const std::string &msg) const { throw parse_error(msg, line_, col_); }

        private:
            std::string_view text_;
            std::size_t pos_ = 0;
            int line_ = 1;
            int col_ = 1;

            static bool digit(char ch) { return ch >= '0' && ch <= '9'; }
            static bool word_start(char ch)
            {
                return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || std::string_view("*!_?-+/<>=$%&").find(ch) != std::string_view::npos;
            }
            static bool word_char(char ch) { return word_start(ch) || digit(ch) || ch == '.' || ch == '#' || ch == ':'; }

            char peek(std::size_t ahead = 0) const { return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0'; }
            char advance()
            {
                const char ch = text_[pos_++];
                if (ch == '\n')
                {
                    ++line_;
                    col_ = 1;
                }
                else
                    ++col_;
                return ch;
            }
            static node_ptr make(node_data d, int l, int c) { return std::make_shared<node>(node{std::move(d), l, c}); }

            node_ptr read_collection(char open, int l, int c)
            {
                const char close = open == '[' ? ']' : open == '(' ? ')' : '}';
                std::vector<node_ptr> elems;
                for (skip_blank(); !at_end() && peek() != close; skip_blank())
                    elems.push_back(read_form());
                if (at_end())
                    throw parse_error(std::string("'") + open + "' was never closed", l, c);
                advance();
                if (open != '{')
                    return make(seq{std::move(elems), open == '('}, l, c);
                if (elems.size() % 2 != 0)
                    throw parse_error("map literal has an odd number of forms", l, c);
                map m;
                for (std::size_t i = 0; i < elems.size(); i += 2)
                    m.entries.emplace_back(std::move(elems[i]), std::move(elems[i + 1]));
                return make(std::move(m), l, c);
            }

            node_ptr read_string()
            {
                const int l = line_, c = col_;
                advance();
                std::string out;
                for (;;)
                {
                    if (at_end())
                        throw parse_error("unterminated string", l, c);
                    char ch = advance();
                    if (ch == '"')
                        break;
                    if (ch == '\\')
                    {
                        if (at_end())
                            throw parse_error("unterminated string", l, c);
                        ch = advance();
                        ch = ch == 'n' ? '\n' : ch == 't' ? '\t' : ch == 'r' ? '\r' : ch;
                    }
                    out += ch;
                }
                return make(std::move(out), l, c);
            }

            node_ptr read_number()
            {
                const int l = line_, c = col_;
                const std::size_t start = pos_;
                bool real = false;
                if (peek() == '-' || peek() == '+')
                    advance();
                while (digit(peek()))
                    advance();
                if (peek() == '.')
                {
                    real = true;
                    advance();
                    while (digit(peek()))
                        advance();
                }
                if (peek() == 'e' || peek() == 'E')
                {
                    real = true;
                    advance();
                    if (peek() == '-' || peek() == '+')
                        advance();
                    while (digit(peek()))
                        advance();
                }
                const std::string text(text_.substr(start, pos_ - start));
                try
                {
                    if (real)
                        return make(std::stod(text), l, c);
                    return make(static_cast<int64_t>(std::stoll(text)), l, c);
                }
                catch (const std::logic_error &)
                {
                    throw parse_error("invalid number '" + text + "'", l, c);
                }
            }

            node_ptr read_word()
            {
                const int l = line_, c = col_;
                const bool is_keyword = peek() == ':';
                if (is_keyword)
                    advance();
                const std::size_t start = pos_;
                while (word_char(peek()))
                    advance();
                std::string w(text_.substr(start, pos_ - start));
                if (is_keyword)
                {
                    if (w.empty())
                        throw parse_error("empty keyword", l, c);
                    return make(keyword{std::move(w)}, l, c);
                }
                if (w == "nil")
                    return make(std::monostate{}, l, c);
                if (w == "true" || w == "false")
                    return make(w == "true", l, c);
                return make(symbol{std::move(w)}, l, c);
            }
        };
    } // namespace detail

    // Reads exactly one form; anything but whitespace or comments after it is an error.
    inline node_ptr parse(std::string_view input)
    {
        detail::reader r(input);
        node_ptr form = r.read_form();
        r.skip_blank();
        if (!r.at_end())
            r.fail("unexpected trailing characters");
        return form;
    }

    template <typename T>
    const T *as(const node &n) { return std::get_if<T>(&n.data); }

    inline const map *as_map(const node &n) { return as<map>(n); }
    inline const std::string *as_string(const node &n) { return as<std::string>(n); }
    inline const keyword *as_keyword(const node &n) { return as<keyword>(n); }
    inline const symbol *as_symbol(const node &n) { return as<symbol>(n); }
    inline const bool *as_bool(const node &n) { return as<bool>(n); }

    inline const std::vector<node_ptr> *as_seq(const node &n)
    {
        const seq *s = as<seq>(n);
        return s ? &s->elems : nullptr;
    }

    // String, keyword or symbol text.
    inline const std::string *as_name(const node &n)
    {
        if (const auto *s = as_string(n))
            return s;
        if (const auto *k = as_keyword(n))
            return &k->name;
        if (const auto *y = as_symbol(n))
            return &y->name;
        return nullptr;
    }

    // Value stored under keyword `key`, nullptr when absent.
    inline node_ptr get(const map &m, std::string_view key)
    {
        for (const auto &kv : m.entries)
            if (const auto *k = as_keyword(*kv.first); k && k->name == key)
                return kv.second;
        return nullptr;
    }

} // namespace infrar::edn
