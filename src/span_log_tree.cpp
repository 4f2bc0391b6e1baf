#include "span_log_tree.hpp"
#include <algorithm>
#include <cctype>

namespace dumpscope {

namespace {

bool contains_icase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
        [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    return it != haystack.end();
}

void render_node(std::string& out, const span_node& node, const filter_query& filter,
                 std::size_t depth, bool header) {
    std::size_t inner = depth;
    if (header) {
        out.append(depth * 4, ' ');
        out += '[';
        out += node.label();
        out += "]\n";
        ++inner;
    }

    for (const auto& e : node.entries()) {
        if (e.event) {
            if (!filter.matches(*e.event)) continue;
            out.append(inner * 4, ' ');
            out += e.event->message;
            out += '\n';
            continue;
        }
        const auto& child = *node.children()[e.child];
        if (child_count(child, filter) == 0) continue;
        render_node(out, child, filter, inner, true);
    }
}

} // anonymous namespace

bool filter_query::empty() const {
    return text.empty() && span_prefix.empty() && min_level <= spdlog::level::trace;
}

bool filter_query::matches(const log_event& ev) const {
    if (ev.level < min_level) return false;

    if (span_prefix.size() > ev.span_path.size()) return false;
    if (!std::equal(span_prefix.begin(), span_prefix.end(), ev.span_path.begin())) return false;

    return contains_icase(ev.message, text);
}

// --- span_node ---

const span_node* span_node::child(const std::string& label) const {
    auto it = m_child_index.find(label);
    if (it == m_child_index.end()) return nullptr;
    return m_children[it->second].get();
}

span_node& span_node::child_for(const std::string& label) {
    auto it = m_child_index.find(label);
    if (it != m_child_index.end()) return *m_children[it->second];

    std::size_t idx = m_children.size();
    m_children.push_back(std::make_unique<span_node>(label));
    m_child_index.emplace(label, idx);

    entry e;
    e.child = idx;
    m_entries.push_back(std::move(e));
    return *m_children.back();
}

std::unique_ptr<span_node> span_node::clone() const {
    auto copy = std::make_unique<span_node>(m_label);
    copy->m_entries = m_entries;
    copy->m_child_index = m_child_index;
    copy->m_event_count = m_event_count;
    copy->m_children.reserve(m_children.size());
    for (const auto& c : m_children) {
        copy->m_children.push_back(c->clone());
    }
    return copy;
}

// --- span_query ---

span_query::iterator::iterator(std::shared_ptr<const span_node> root, const span_node* start,
                               std::shared_ptr<const filter_query> filter)
    : m_root(std::move(root)), m_filter(std::move(filter))
{
    if (start) {
        m_stack.push_back({start, 0});
        advance();
    }
}

void span_query::iterator::advance() {
    m_current = nullptr;

    while (!m_stack.empty()) {
        auto& top = m_stack.back();
        const auto& entries = top.node->entries();
        if (top.next == entries.size()) {
            m_stack.pop_back();
            continue;
        }

        const auto& e = entries[top.next++];
        if (e.event) {
            if (m_filter->matches(*e.event)) {
                m_current = e.event.get();
                return;
            }
            continue;
        }

        const auto* child = top.node->children()[e.child].get();
        m_stack.push_back({child, 0});
    }
}

span_query::span_query(std::shared_ptr<const span_node> root, const span_node* start,
                       filter_query filter)
    : m_root(std::move(root)), m_start(start),
      m_filter(std::make_shared<const filter_query>(std::move(filter)))
{}

std::vector<log_event_ptr> span_query::collect() const {
    // Re-walk the entries so the shared pointers (not raw ones) come back.
    std::vector<log_event_ptr> out;
    std::vector<std::pair<const span_node*, std::size_t>> stack;
    if (m_start) stack.emplace_back(m_start, 0);

    while (!stack.empty()) {
        auto& [node, next] = stack.back();
        if (next == node->entries().size()) {
            stack.pop_back();
            continue;
        }
        const auto& e = node->entries()[next++];
        if (e.event) {
            if (m_filter->matches(*e.event)) out.push_back(e.event);
        } else {
            stack.emplace_back(node->children()[e.child].get(), 0);
        }
    }
    return out;
}

// --- span_log_tree ---

span_log_tree::span_log_tree()
    : m_root(std::make_unique<span_node>(std::string{}))
{}

bool span_log_tree::ingest(log_event ev) {
    auto ptr = std::make_shared<const log_event>(std::move(ev));

    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) return false;

    span_node* node = m_root.get();
    node->m_event_count++;
    for (const auto& label : ptr->span_path) {
        node = &node->child_for(label);
        node->m_event_count++;
    }

    span_node::entry e;
    e.event = std::move(ptr);
    node->m_entries.push_back(std::move(e));

    m_frozen.reset();
    return true;
}

std::shared_ptr<const span_node> span_log_tree::snapshot() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_frozen) {
        m_frozen = std::shared_ptr<const span_node>(m_root->clone());
    }
    return m_frozen;
}

span_query span_log_tree::query(filter_query filter) {
    auto root = snapshot();
    const span_node* start = root.get();
    return span_query(std::move(root), start, std::move(filter));
}

void span_log_tree::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_closed = true;
}

bool span_log_tree::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

std::size_t span_log_tree::event_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_root->event_count();
}

// --- free functions ---

span_query query(std::shared_ptr<const span_node> root, filter_query filter) {
    const span_node* start = root.get();
    return span_query(std::move(root), start, std::move(filter));
}

span_query query(std::shared_ptr<const span_node> root, const span_node& start, filter_query filter) {
    return span_query(std::move(root), &start, std::move(filter));
}

std::size_t child_count(const span_node& node, const filter_query& filter) {
    if (filter.empty()) return node.event_count();

    std::size_t count = 0;
    for (const auto& e : node.entries()) {
        if (e.event) {
            if (filter.matches(*e.event)) ++count;
        } else {
            count += child_count(*node.children()[e.child], filter);
        }
    }
    return count;
}

const span_node* find_span(const span_node& root, const std::vector<std::string>& path) {
    const span_node* node = &root;
    for (const auto& label : path) {
        node = node->child(label);
        if (!node) return nullptr;
    }
    return node;
}

std::string render_text(const span_node& node, const filter_query& filter) {
    std::string out;
    // The root has an empty label and no header line.
    render_node(out, node, filter, 0, !node.label().empty());
    return out;
}

} // namespace dumpscope
