#pragma once

#include <spdlog/common.h>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dumpscope {

// One captured diagnostic record. span_path is outermost first,
// e.g. {"thread 3", "frame 12", "cfi-eval"}.
struct log_event {
    spdlog::level::level_enum level = spdlog::level::info;
    std::string message;
    std::chrono::system_clock::time_point time;
    std::vector<std::string> span_path;
};

using log_event_ptr = std::shared_ptr<const log_event>;

// Read-only predicate over log events. A default-constructed query
// matches everything.
struct filter_query {
    std::string text;                      // case-insensitive message substring
    std::vector<std::string> span_prefix;  // event path must start with these labels
    spdlog::level::level_enum min_level = spdlog::level::trace;

    bool empty() const;
    bool matches(const log_event& ev) const;
};

// A node of the span tree. Entries interleave events attached at this
// node with the points where child spans were first entered, so a
// pre-order walk replays the chronological shape of the analysis.
class span_node {
public:
    struct entry {
        log_event_ptr event;      // set for an event entry
        std::size_t child = 0;    // index into children() otherwise
    };

    explicit span_node(std::string label) : m_label(std::move(label)) {}

    const std::string& label() const { return m_label; }
    const std::vector<entry>& entries() const { return m_entries; }
    const std::vector<std::unique_ptr<span_node>>& children() const { return m_children; }

    // Child with the given label, or nullptr.
    const span_node* child(const std::string& label) const;

    // Events in this subtree, this node's own included.
    std::size_t event_count() const { return m_event_count; }

private:
    friend class span_log_tree;

    span_node& child_for(const std::string& label);
    std::unique_ptr<span_node> clone() const;

    std::string m_label;
    std::vector<entry> m_entries;
    std::vector<std::unique_ptr<span_node>> m_children;
    std::unordered_map<std::string, std::size_t> m_child_index;
    std::size_t m_event_count = 0;
};

// One match yielded by span_query. path is the event's span path.
struct query_match {
    const std::vector<std::string>& path;
    const log_event& event;
};

// Lazy depth-first, pre-order traversal over a frozen tree. Every begin()
// starts a fresh walk. The query and each of its iterators share the root
// and the filter, so an iterator stays valid after its query is gone.
class span_query {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = query_match;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = query_match;

        iterator() = default;

        query_match operator*() const { return {m_current->span_path, *m_current}; }
        iterator& operator++() { advance(); return *this; }
        void operator++(int) { advance(); }

        friend bool operator==(const iterator& a, const iterator& b) {
            return a.m_current == b.m_current;
        }
        friend bool operator!=(const iterator& a, const iterator& b) { return !(a == b); }

    private:
        friend class span_query;

        struct frame {
            const span_node* node;
            std::size_t next;
        };

        iterator(std::shared_ptr<const span_node> root, const span_node* start,
                 std::shared_ptr<const filter_query> filter);
        void advance();

        std::shared_ptr<const span_node> m_root;
        std::shared_ptr<const filter_query> m_filter;
        std::vector<frame> m_stack;
        const log_event* m_current = nullptr;
    };

    span_query(std::shared_ptr<const span_node> root, const span_node* start, filter_query filter);

    iterator begin() const { return iterator(m_root, m_start, m_filter); }
    iterator end() const { return iterator(); }

    // Drains the traversal; mostly for tests and reports.
    std::vector<log_event_ptr> collect() const;

private:
    std::shared_ptr<const span_node> m_root;
    const span_node* m_start;
    std::shared_ptr<const filter_query> m_filter;
};

// Owner of the live tree. ingest() is called from the analysis thread;
// readers only ever see frozen copies handed out by snapshot().
class span_log_tree {
public:
    span_log_tree();

    // Appends the event at the node found (or created) by walking its span
    // path. Returns false once the tree is closed.
    bool ingest(log_event ev);

    // Frozen copy of the current tree. Returns the previous copy when
    // nothing was ingested since it was taken.
    std::shared_ptr<const span_node> snapshot();

    span_query query(filter_query filter);

    // Stop accepting events. Ingests already in progress complete first.
    void close();
    bool closed() const;

    std::size_t event_count() const;

private:
    mutable std::mutex m_mutex;
    std::unique_ptr<span_node> m_root;
    std::shared_ptr<const span_node> m_frozen;
    bool m_closed = false;
};

// Traversal over a frozen tree, optionally starting at a subtree of it.
span_query query(std::shared_ptr<const span_node> root, filter_query filter);
span_query query(std::shared_ptr<const span_node> root, const span_node& start, filter_query filter);

// Number of events in the subtree that match the filter. Agrees with what
// query() yields for the same subtree.
std::size_t child_count(const span_node& node, const filter_query& filter);

// Node reached by walking the label path from root, or nullptr.
const span_node* find_span(const span_node& root, const std::vector<std::string>& path);

// Indented text view: four spaces per level, span labels in brackets,
// one message per line. Subtrees without matching events are left out.
std::string render_text(const span_node& node, const filter_query& filter = {});

} // namespace dumpscope
