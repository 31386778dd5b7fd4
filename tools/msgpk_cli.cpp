
#include "msgpk/msgpk.hpp"
#include "msgpk/msgpk_easy.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <locale>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static void usage() {
    std::cerr <<
        "msgpk (C++) - MessagePack inspector\n"
        "\n"
        "Usage:\n"
        "  msgpk info <FILE> [--zlib] [--compat] [--no-color]\n"
        "  msgpk tree <FILE> [--prefix <P>] [--max-depth N] [--zlib] [--compat] [--no-color]\n"
        "  msgpk hex  <FILE> [--zlib] [--compat] [--no-color]\n"
        "  msgpk show <FILE> [<PATH>] [--max-elems N] [--zlib] [--compat] [--no-color]\n"
        "\n"
        "Paths address top-level values by index, then map keys and array elements,\n"
        "e.g. 0.users[2].name\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    bool zlib{false};
    bool compat{false};
    bool no_color{false};
    std::string prefix;
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t max_elems{20};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional path for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--zlib") a.zlib = true;
        else if (opt == "--compat") a.compat = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--prefix" && i < argc) a.prefix = argv[i++];
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "hex" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

static msgpk::ReadOptions read_options(const Args& a) {
    msgpk::ReadOptions ro;
    ro.zlib = a.zlib;
    ro.unpack.compatibility = a.compat;
    return ro;
}

// ----------------- Value formatting -----------------

static std::string clip(std::string s, std::size_t max_len) {
    if (s.size() > max_len) {
        s.resize(max_len);
        s += "...";
    }
    return s;
}

// One-line rendering of a value; containers render as their size.
static std::string summary(const msgpk::Value& v) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    switch (v.kind()) {
        case msgpk::Kind::Nil: return "nil";
        case msgpk::Kind::Bool: return v.bool_value() ? "true" : "false";
        case msgpk::Kind::Int: oss << v.int64_value(); break;
        case msgpk::Kind::UInt: oss << v.uint64_value(); break;
        case msgpk::Kind::Float: oss << v.float_value(); break;
        case msgpk::Kind::Double: oss << v.double_value(); break;
        case msgpk::Kind::String: oss << '"' << clip(v.string_value(), 48) << '"'; break;
        case msgpk::Kind::Binary: {
            const auto& b = std::get<msgpk::Bytes>(v.v);
            oss << "<" << b.size() << " bytes> " << msgpk::easy::to_hex(b.data(), std::min<std::size_t>(b.size(), 8))
                << (b.size() > 8 ? "..." : "");
            break;
        }
        case msgpk::Kind::Array: oss << "[" << v.count() << "]"; break;
        case msgpk::Kind::Map: oss << "{" << v.count() << "}"; break;
        case msgpk::Kind::Extended: {
            const auto& e = v.extended_value();
            oss << "ext(" << static_cast<int>(e.type) << ") <" << e.data.size() << " bytes>";
            break;
        }
        case msgpk::Kind::Timestamp: {
            const auto& t = v.timestamp_value();
            oss << t.seconds << "." << std::setw(9) << std::setfill('0') << t.nanoseconds << "s";
            break;
        }
    }
    return oss.str();
}

static bool is_container(const msgpk::Value& v) {
    return v.is_array() || v.is_map();
}

static std::size_t encoded_size(const msgpk::Value& v) {
    return msgpk::pack(v).size();
}

// ----------------- Value tree -----------------

// Every node of the decoded stream, addressed by a path such as "0.users[2].name".
struct UiNode {
    std::string name;
    std::string full_path; // empty for root
    const msgpk::Value* value{nullptr};
    std::vector<UiNode> children;
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
};

static void ui_build(UiNode& node) {
    const msgpk::Value& v = *node.value;
    if (v.is_array()) {
        const auto& arr = v.as_array();
        node.children.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i) {
            UiNode child;
            child.name = "[" + std::to_string(i) + "]";
            child.full_path = node.full_path + child.name;
            child.value = &arr[i];
            ui_build(child);
            node.children.push_back(std::move(child));
        }
    } else if (v.is_map()) {
        const auto& m = v.as_map();
        node.children.reserve(m.size());
        for (const auto& kv : m) {
            UiNode child;
            if (kv.first.is_string()) {
                child.name = kv.first.string_value();
                child.full_path = node.full_path + "." + child.name;
            } else if (kv.first.is_integer()) {
                child.name = "[" + summary(kv.first) + "]";
                child.full_path = node.full_path + child.name;
            } else {
                child.name = "{" + summary(kv.first) + "}";
                child.full_path = node.full_path + "." + child.name;
            }
            child.value = &kv.second;
            ui_build(child);
            node.children.push_back(std::move(child));
        }
    }
}

static UiNode ui_root(const std::vector<msgpk::Value>& values) {
    UiNode root;
    root.name = "<root>";
    root.children.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i) {
        UiNode child;
        child.name = std::to_string(i);
        child.full_path = child.name;
        child.value = &values[i];
        ui_build(child);
        root.children.push_back(std::move(child));
    }
    return root;
}

static bool path_extends(const std::string& path, const std::string& prefix) {
    if (path.size() < prefix.size() || path.compare(0, prefix.size(), prefix) != 0) return false;
    if (path.size() == prefix.size()) return true;
    const char next = path[prefix.size()];
    return next == '.' || next == '[';
}

static const UiNode* ui_find(const UiNode& root, const std::string& path) {
    if (path.empty() || path == "<root>") return &root;
    const UiNode* cur = &root;
    while (cur) {
        const UiNode* next = nullptr;
        for (const auto& child : cur->children) {
            if (child.full_path == path) return &child;
            if (path_extends(path, child.full_path)) {
                next = &child;
                break;
            }
        }
        cur = next;
    }
    return nullptr;
}

static void print_tree(
    const UiNode& node,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth
) {
    if (depth > max_depth) return;
    for (const auto& child : node.children) {
        std::string pad(indent, ' ');
        const msgpk::Value& v = *child.value;

        if (is_container(v)) {
            std::cout << pad
                      << ansi.magenta() << child.name << "/" << ansi.reset()
                      << " " << ansi.gray() << msgpk::to_string(v.kind()) << " " << summary(v) << ansi.reset()
                      << "\n";
            print_tree(child, ansi, indent + 2, depth + 1, max_depth);
        } else {
            std::cout << pad
                      << ansi.cyan() << child.name << ansi.reset()
                      << " " << ansi.gray() << msgpk::to_string(v.kind()) << ansi.reset()
                      << " " << ansi.yellow() << summary(v) << ansi.reset()
                      << "\n";
        }
    }
}


// ----------------- Interactive UI helpers (FTXUI) -----------------

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = !child.children.empty();
        out.push_back(UiRow{&child, depth, is_dir});
        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

static void print_value_preview(const msgpk::Value& v, std::size_t max_elems);

static std::string preview_to_string(const msgpk::Value& v, std::size_t max_elems) {
    std::ostringstream oss;
    std::streambuf* old = std::cout.rdbuf(oss.rdbuf());
    // Same printer as the non-interactive output.
    print_value_preview(v, max_elems);
    std::cout.rdbuf(old);
    return oss.str();
}

static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    cur.reserve(128);
    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());

    for (const auto& line : lines) {
        if (line.empty()) {
            els.push_back(text(""));
            continue;
        }

        // Section headers like "map:" / "preview:"
        if (line.back() == ':' && line.size() < 40 && line.rfind("  ", 0) != 0) {
            els.push_back(text(line) | bold | color(Color::Magenta));
            continue;
        }

        if (line.rfind("  ", 0) == 0) {
            std::string rest = line.substr(2);

            // Quoted strings: "hello"
            if (!rest.empty() && rest.front() == '"') {
                els.push_back(hbox({
                    text("  "),
                    text(rest) | color(Color::Green),
                }));
                continue;
            }

            // key=value such as "  entries=3" or "  name=\"ada\""
            auto eq = rest.find('=');
            if (eq != std::string::npos) {
                std::string k = rest.substr(0, eq);
                std::string v = rest.substr(eq + 1);
                Color vc = (!v.empty() && v.front() == '"') ? Color::Green : Color::GrayLight;
                els.push_back(hbox({
                    text("  "),
                    text(k) | bold | color(Color::Yellow),
                    text("=") | color(Color::GrayDark),
                    text(v) | color(vc) | flex,
                }));
                continue;
            }

            els.push_back(text(line) | color(Color::White));
            continue;
        }

        // One-liners like "uint: 42"
        auto colon = line.find(':');
        if (colon != std::string::npos && colon < 32) {
            els.push_back(hbox({
                text(line.substr(0, colon + 1)) | bold | color(Color::Magenta),
                text(line.substr(colon + 1)) | color(Color::White) | flex,
            }));
            continue;
        }

        els.push_back(text(line) | color(Color::White));
    }

    return vbox(std::move(els));
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (rows.empty()) return nullptr;
    if (idx < 0) return nullptr;
    if ((std::size_t)idx >= rows.size()) return nullptr;
    return &rows[(std::size_t)idx];
}

// ----------------- Value preview -----------------

static void print_hex_lines(const std::uint8_t* p, std::size_t n, std::size_t max_elems) {
    std::size_t show = std::min(max_elems, n);
    for (std::size_t off = 0; off < show; off += 16) {
        std::size_t len = std::min<std::size_t>(16, show - off);
        std::cout << "  " << msgpk::easy::to_hex(p + off, len, true) << "\n";
    }
    if (show < n) std::cout << "  ... " << (n - show) << " more bytes\n";
}

static void print_value_preview(const msgpk::Value& v, std::size_t max_elems) {
    switch (v.kind()) {
        case msgpk::Kind::Map: {
            const auto& m = v.as_map();
            std::cout << "map:\n";
            std::cout << "  entries=" << m.size() << "\n";
            std::cout << "preview:\n";
            std::size_t i = 0;
            for (const auto& kv : m) {
                if (i++ == max_elems) {
                    std::cout << "  ...\n";
                    break;
                }
                std::string key = kv.first.is_string() ? kv.first.string_value() : summary(kv.first);
                std::cout << "  " << key << "=" << summary(kv.second) << "\n";
            }
            return;
        }
        case msgpk::Kind::Array: {
            const auto& arr = v.as_array();
            std::cout << "array:\n";
            std::cout << "  count=" << arr.size() << "\n";
            std::cout << "preview:\n";
            std::size_t show = std::min(max_elems, arr.size());
            for (std::size_t i = 0; i < show; ++i) {
                std::cout << "  [" << i << "]=" << summary(arr[i]) << "\n";
            }
            if (show < arr.size()) std::cout << "  ...\n";
            return;
        }
        case msgpk::Kind::String: {
            std::string s = v.string_value();
            std::cout << "string:\n";
            std::cout << "  length=" << s.size() << "\n";
            std::cout << "preview:\n";
            std::cout << "  \"" << clip(s, 4 * max_elems) << "\"\n";
            return;
        }
        case msgpk::Kind::Binary: {
            const auto& b = std::get<msgpk::Bytes>(v.v);
            std::cout << "binary:\n";
            std::cout << "  length=" << b.size() << "\n";
            std::cout << "preview:\n";
            print_hex_lines(b.data(), b.size(), max_elems);
            return;
        }
        case msgpk::Kind::Extended: {
            const auto& e = v.extended_value();
            std::cout << "extended:\n";
            std::cout << "  type=" << static_cast<int>(e.type) << "\n";
            std::cout << "  length=" << e.data.size() << "\n";
            std::cout << "preview:\n";
            print_hex_lines(e.data.data(), e.data.size(), max_elems);
            return;
        }
        case msgpk::Kind::Timestamp: {
            const auto& t = v.timestamp_value();
            std::cout << "timestamp:\n";
            std::cout << "  seconds=" << t.seconds << "\n";
            std::cout << "  nanoseconds=" << t.nanoseconds << "\n";
            return;
        }
        default:
            std::cout << msgpk::to_string(v.kind()) << ": " << summary(v) << "\n";
            return;
    }
}

// ----------------- Interactive browser (FTXUI) -----------------

struct StatusKV {
    std::string k;
    std::string v;
};

static std::vector<StatusKV> describe(const msgpk::Value& v) {
    std::vector<StatusKV> out;
    out.push_back({"kind", msgpk::to_string(v.kind())});
    if (is_container(v)) out.push_back({"count", std::to_string(v.count())});
    out.push_back({"bytes", std::to_string(encoded_size(v))});
    if (v.is_extended()) out.push_back({"ext type", std::to_string(static_cast<int>(v.extended_type()))});
    return out;
}

static ftxui::Element key_hint(const std::string& key, const std::string& label) {
    using namespace ftxui;
    return hbox({
        text(key) | bold | color(Color::Yellow),
        text(" " + label + "  ") | color(Color::GrayDark),
    });
}

// First visible row of a window of `visible` rows that keeps `selected` in view.
static int scroll_to_show(int scroll, int selected, int total, int visible) {
    const int max_scroll = std::max(0, total - visible);
    if (selected < scroll) scroll = selected;
    if (selected >= scroll + visible) scroll = selected - visible + 1;
    return std::clamp(scroll, 0, max_scroll);
}

class ValueBrowser {
public:
    ValueBrowser(const UiNode& root, const UiNode& start, std::string file, std::size_t max_elems)
        : root_(root), start_(start), file_(std::move(file)), max_elems_(max_elems) {
        if (!start_.full_path.empty()) expanded_.insert(start_.full_path);
        refresh_rows();
        select(0);
    }

    ftxui::Element render() {
        using namespace ftxui;
        const auto dim = Terminal::Size();
        const int term_w = std::max(20, dim.dimx);
        const int term_h = std::max(10, dim.dimy);

        // Header, separator and border take 4 rows; keep a little margin.
        const int visible = std::max(3, term_h - 6);

        return hbox({
                   render_tree(visible) | size(WIDTH, EQUAL, kTreeWidth),
                   render_details() | flex,
               }) |
               size(WIDTH, EQUAL, term_w) | size(HEIGHT, EQUAL, term_h);
    }

    bool on_event(ftxui::Event e) {
        using ftxui::Event;
        if (rows_.empty()) return false;

        if (e == Event::ArrowUp) return select(selected_ - 1);
        if (e == Event::ArrowDown) return select(selected_ + 1);
        if (e == Event::PageUp) return select(selected_ - kPageRows);
        if (e == Event::PageDown) return select(selected_ + kPageRows);
        if (e == Event::Home) return select(0);
        if (e == Event::End) return select(static_cast<int>(rows_.size()) - 1);
        if (e == Event::ArrowRight) return set_expanded(true);
        if (e == Event::ArrowLeft) return set_expanded(false);
        if (e == Event::Return) return select(selected_);

        if (e.is_mouse()) {
            const ftxui::Mouse m = e.mouse();
            if (m.button == ftxui::Mouse::WheelUp) return select(selected_ - 3);
            if (m.button == ftxui::Mouse::WheelDown) return select(selected_ + 3);
        }
        return false;
    }

private:
    static constexpr int kTreeWidth = 60;
    static constexpr int kPageRows = 25;

    const UiNode& root_;
    const UiNode& start_;
    std::string file_;
    std::size_t max_elems_;

    std::set<std::string> expanded_;
    std::vector<UiRow> rows_;
    int selected_{0};
    int scroll_{0};

    std::string path_;
    std::vector<StatusKV> status_;
    std::string preview_;

    void refresh_rows() {
        rows_.clear();
        if (start_.children.empty() && &start_ != &root_) {
            // A scalar start node is listed on its own.
            rows_.push_back(UiRow{&start_, 0, false});
        } else {
            flatten_rows(start_, expanded_, 0, rows_);
        }
    }

    bool select(int idx) {
        if (rows_.empty()) return false;
        selected_ = std::clamp(idx, 0, static_cast<int>(rows_.size()) - 1);

        const UiNode& n = *rows_[static_cast<std::size_t>(selected_)].node;
        path_ = n.full_path;
        try {
            status_ = describe(*n.value);
            preview_ = preview_to_string(*n.value, max_elems_);
        } catch (const std::exception& e) {
            status_.assign(1, StatusKV{"error", e.what()});
            preview_.clear();
        }
        return true;
    }

    bool set_expanded(bool open) {
        const UiRow* r = safe_row_at(rows_, selected_);
        if (!r || !r->is_dir) return true;
        if (open) expanded_.insert(r->node->full_path);
        else expanded_.erase(r->node->full_path);
        refresh_rows();
        return select(selected_);
    }

    ftxui::Element tree_line(const UiRow& r) const {
        using namespace ftxui;
        const UiNode& n = *r.node;
        std::string glyph = "• ";
        if (r.is_dir) glyph = expanded_.count(n.full_path) ? "▾ " : "▸ ";

        std::string meta = msgpk::to_string(n.value->kind());
        if (is_container(*n.value)) meta = summary(*n.value) + "  " + meta;

        return hbox({
                   text(std::string(static_cast<std::size_t>(r.depth) * 2, ' ') + glyph + n.name) |
                       color(Color::Cyan) | flex,
                   text(meta) | color(Color::Yellow),
               }) |
               size(WIDTH, LESS_THAN, kTreeWidth - 2);
    }

    ftxui::Element render_tree(int visible) {
        using namespace ftxui;
        const int total = static_cast<int>(rows_.size());
        scroll_ = scroll_to_show(scroll_, selected_, total, visible);
        const int end = std::min(total, scroll_ + visible);

        Elements items;
        if (scroll_ > 0) items.push_back(text("↑ more") | color(Color::GrayDark));
        for (int i = scroll_; i < end; ++i) {
            Element line = tree_line(rows_[static_cast<std::size_t>(i)]);
            items.push_back(i == selected_ ? line | inverted : line);
        }
        if (end < total) items.push_back(text("↓ more") | color(Color::GrayDark));

        Element header = hbox({
            text("msgpk") | bold | color(Color::White),
            text("  "),
            text(file_) | color(Color::GrayDark),
            filler(),
            key_hint("q", "quit"),
            key_hint("←→", "collapse/expand"),
            key_hint("↑↓", "move"),
            key_hint("PgUp/PgDn", "page"),
        });

        return vbox({header, separator(), vbox(std::move(items)) | flex}) | flex | border;
    }

    ftxui::Element render_details() const {
        using namespace ftxui;
        Elements meta;
        for (const auto& kv : status_) {
            meta.push_back(hbox({
                text(kv.k) | bold | color(Color::Yellow),
                text(": ") | color(Color::GrayDark),
                text(kv.v) | color(Color::GrayLight) | flex,
            }));
        }
        if (meta.empty()) meta.push_back(text("(no metadata)") | color(Color::GrayDark));

        Element top = vbox({
            text(path_.empty() ? "<root>" : path_) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta)),
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10);

        Element body = vbox({
            text("preview") | bold | color(Color::Magenta),
            separator(),
            render_preview_colored(preview_),
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) | flex | border;
    }
};

} // namespace

int main(int argc, char** argv) {
    Args a;
    if (!parse_args(argc, argv, a)) {
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    try {
        const msgpk::ReadOptions ro = read_options(a);

        if (a.cmd == "info") {
            const msgpk::Bytes bytes = msgpk::read_file_bytes(a.file, ro);
            const std::vector<msgpk::Value> values = msgpk::unpack_all(bytes, ro.unpack);

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << std::filesystem::file_size(a.file) << "\n";
            if (a.zlib) {
                std::cout << ansi.bold() << "Inflated size" << ansi.reset() << ": " << bytes.size() << "\n";
            }
            std::cout << ansi.bold() << "CRC32" << ansi.reset() << ": " << hex8(msgpk::crc32(bytes)) << "\n";
            std::cout << ansi.bold() << "Values" << ansi.reset() << ": " << values.size() << "\n";
            for (std::size_t i = 0; i < values.size(); ++i) {
                std::cout << "  " << ansi.cyan() << i << ansi.reset()
                          << " " << ansi.yellow() << msgpk::to_string(values[i].kind()) << ansi.reset()
                          << " " << ansi.gray() << encoded_size(values[i]) << " bytes" << ansi.reset() << "\n";
            }
            return 0;
        }

        if (a.cmd == "hex") {
            msgpk::ByteCursor cur(msgpk::read_file_bytes(a.file, ro));
            std::cout << ansi.bold() << "MessagePack stream" << ansi.reset() << ": " << a.file
                      << " (" << cur.size() << " bytes)\n";

            std::size_t index = 0;
            while (!cur.empty()) {
                auto r = msgpk::unpack(cur, ro.unpack);
                const std::size_t len = r.remainder.offset() - cur.offset();
                const std::size_t show = std::min<std::size_t>(len, 16);

                std::ostringstream off;
                off << std::hex << std::setw(8) << std::setfill('0') << cur.offset();

                std::cout << ansi.gray() << off.str() << ansi.reset()
                          << "  " << ansi.cyan() << "#" << index << ansi.reset()
                          << "  " << msgpk::easy::to_hex(cur.data(), show, true) << (show < len ? " ..." : "")
                          << "  " << ansi.yellow() << msgpk::to_string(r.value.kind()) << ansi.reset()
                          << " " << ansi.dim() << summary(r.value) << " (" << len << " bytes)" << ansi.reset()
                          << "\n";
                cur = r.remainder;
                ++index;
            }
            return 0;
        }

        if (a.cmd == "tree") {
            const std::vector<msgpk::Value> values = msgpk::read_file(a.file, ro);
            UiNode root = ui_root(values);

            const UiNode* node = &root;
            if (!a.prefix.empty()) {
                node = ui_find(root, a.prefix);
                if (!node) {
                    std::cerr << "prefix not found: " << a.prefix << "\n";
                    return 2;
                }
                std::cout << ansi.dim() << "prefix: " << a.prefix << ansi.reset() << "\n";
            }

            std::cout << ansi.bold() << "MessagePack value tree" << ansi.reset() << ": " << a.file << "\n";
            if (node != &root && !is_container(*node->value)) {
                std::cout << ansi.cyan() << node->name << ansi.reset()
                          << " " << ansi.gray() << msgpk::to_string(node->value->kind()) << ansi.reset()
                          << " " << ansi.yellow() << summary(*node->value) << ansi.reset() << "\n";
                return 0;
            }
            print_tree(*node, ansi, 0, 0, a.max_depth);
            return 0;
        }

        if (a.cmd == "show") {
            const std::vector<msgpk::Value> values = msgpk::read_file(a.file, ro);
            const UiNode root = ui_root(values);

            const UiNode* start = &root;
            if (!a.path.empty() && a.path != "<root>") {
                start = ui_find(root, a.path);
                if (!start) {
                    std::cerr << ansi.red() << "Error" << ansi.reset() << ": path not found: " << a.path << "\n";
                    return 2;
                }
            }

            ValueBrowser browser(root, *start, a.file, a.max_elems);

            auto screen = ftxui::ScreenInteractive::TerminalOutput();
            screen.TrackMouse(true);

            auto view = ftxui::Renderer([&] { return browser.render(); });
            auto app = ftxui::CatchEvent(view, [&](ftxui::Event e) {
                if (e == ftxui::Event::Character('q') || e == ftxui::Event::Escape) {
                    screen.Exit();
                    return true;
                }
                return browser.on_event(e);
            });

            screen.Loop(app);
            return 0;
        }

    } catch (const msgpk::MsgpkError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
