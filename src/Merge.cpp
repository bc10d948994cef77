/**
 * @file Merge.cpp
 * @brief Implementation of the sorted merge
 *
 * Each pass scans the existing elements once and records what to do in a
 * MergePlan without touching the container. A clean scan is then applied in
 * a single forward rebuild of the child list. A scan that finds the
 * container unsorted is discarded, the container is sorted, and the scan is
 * run one more time.
 */

#include "tidymerge/Merge.hpp"
#include "tidymerge/Trivia.hpp"

#include <algorithm>
#include <numeric>
#include <optional>
#include <string>
#include <utility>

namespace tidymerge {

namespace {

    struct KeyedItem {
        std::string key;
        Element element;
    };

    struct ExistingElement {
        std::size_t index; // child index in the container
        std::string key;
    };

    /**
     * @brief Anchor for a run of inserted nodes
     *
     * Before(i) places the run in front of child i of the original list;
     * AtEnd appends after the last child.
     */
    struct InsertionPoint {
        enum class Kind {
            Before,
            AtEnd
        };

        Kind kind = Kind::AtEnd;
        std::size_t index = 0;

        static InsertionPoint before(std::size_t i) { return {Kind::Before, i}; }
        static InsertionPoint at_end() { return {Kind::AtEnd, 0}; }
    };

    struct Insertion {
        InsertionPoint at;
        std::optional<Node> separator;
        std::vector<std::size_t> items; // indices into the sorted new items
    };

    struct MergePlan {
        // Ascending by anchor; at most one insertion per anchor
        std::vector<Insertion> insertions;
        // (child index, item index), ascending by child index
        std::vector<std::pair<std::size_t, std::size_t>> replacements;
        bool changed = false;
        bool disordered = false;
    };

    std::vector<KeyedItem> sort_new_items(std::vector<Element> elements,
                                          const KeySelector& key_of) {
        std::vector<KeyedItem> items;
        items.reserve(elements.size());
        for (auto& e : elements) {
            std::string key = key_of(e);
            items.push_back(KeyedItem{std::move(key), std::move(e)});
        }
        std::stable_sort(items.begin(), items.end(),
                         [](const KeyedItem& a, const KeyedItem& b) { return a.key < b.key; });
        return items;
    }

    std::vector<ExistingElement> key_existing(const Container& container,
                                              const KeySelector& key_of) {
        std::vector<ExistingElement> out;
        for (std::size_t i : container.element_indices()) {
            out.push_back(ExistingElement{i, key_of(*as_element(container[i]))});
        }
        return out;
    }

    /**
     * @brief Scan existing elements against the sorted new items
     *
     * With @p check_order set, the scan stops at the first element whose key
     * is below its predecessor's and returns a plan flagged as disordered.
     * Such a plan is incomplete and must not be applied.
     */
    MergePlan plan_merge(const Container& container,
                         const std::vector<ExistingElement>& existing,
                         const std::vector<KeyedItem>& items,
                         bool check_order) {
        MergePlan plan;
        std::size_t cursor = 0;
        const std::string* last_key = nullptr;

        for (const auto& o : existing) {
            // New items sorting before this element go in front of its trivia
            if (cursor < items.size() && items[cursor].key < o.key) {
                Insertion insertion;
                insertion.at = InsertionPoint::before(leading_trivia(container, o.index).begin);
                insertion.separator = sample_separator(container, o.index);
                while (cursor < items.size() && items[cursor].key < o.key) {
                    insertion.items.push_back(cursor++);
                }
                plan.insertions.push_back(std::move(insertion));
                plan.changed = true;
            }

            if (cursor < items.size() && items[cursor].key == o.key) {
                if (!plan.changed && items[cursor].element != *as_element(container[o.index])) {
                    plan.changed = true;
                }
                plan.replacements.emplace_back(o.index, cursor++);
            }

            if (check_order && last_key != nullptr && o.key < *last_key) {
                plan.disordered = true;
                return plan;
            }
            last_key = &o.key;
        }

        if (cursor < items.size()) {
            plan.changed = true;

            // Right after the last element, ahead of trailing trivia
            Insertion tail;
            if (!existing.empty()) {
                const std::size_t last = existing.back().index;
                tail.at = last + 1 < container.size() ? InsertionPoint::before(last + 1)
                                                      : InsertionPoint::at_end();
                tail.separator = sample_separator(container, last);
            }
            while (cursor < items.size()) {
                tail.items.push_back(cursor++);
            }
            plan.insertions.push_back(std::move(tail));
        }

        return plan;
    }

    void apply_plan(Container& container, MergePlan& plan, std::vector<KeyedItem>& items) {
        std::size_t added = 0;
        for (const auto& insertion : plan.insertions) {
            added += insertion.items.size() * (insertion.separator ? 2 : 1);
        }

        std::vector<Node> old = container.release();
        std::vector<Node> out;
        out.reserve(old.size() + added);

        auto emit = [&](const Insertion& insertion) {
            for (std::size_t idx : insertion.items) {
                if (insertion.separator) {
                    out.push_back(*insertion.separator);
                }
                out.push_back(std::move(items[idx].element));
            }
        };

        auto ins = plan.insertions.begin();
        auto rep = plan.replacements.begin();

        for (std::size_t i = 0; i < old.size(); ++i) {
            while (ins != plan.insertions.end() &&
                   ins->at.kind == InsertionPoint::Kind::Before && ins->at.index == i) {
                emit(*ins++);
            }
            if (rep != plan.replacements.end() && rep->first == i) {
                out.push_back(std::move(items[rep->second].element));
                ++rep;
            } else {
                out.push_back(std::move(old[i]));
            }
        }
        for (; ins != plan.insertions.end(); ++ins) {
            emit(*ins);
        }

        container.assign(std::move(out));
    }

    /**
     * @brief Rebuild the child list in stable key order
     *
     * Every node is either part of some element's leading trivia or trails
     * the last element, so nothing is dropped.
     */
    void rebuild_sorted(Container& container, const std::vector<ExistingElement>& existing) {
        if (existing.empty()) {
            return;
        }

        std::vector<TriviaRange> leading;
        leading.reserve(existing.size());
        for (const auto& e : existing) {
            leading.push_back(leading_trivia(container, e.index));
        }

        std::vector<std::size_t> order(existing.size());
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            return existing[a].key < existing[b].key;
        });

        std::vector<Node> old = container.release();
        std::vector<Node> out;
        out.reserve(old.size());

        for (std::size_t j : order) {
            for (std::size_t i = leading[j].begin; i < leading[j].end; ++i) {
                out.push_back(std::move(old[i]));
            }
            out.push_back(std::move(old[existing[j].index]));
        }
        for (std::size_t i = existing.back().index + 1; i < old.size(); ++i) {
            out.push_back(std::move(old[i]));
        }

        container.assign(std::move(out));
    }

    bool keys_sorted(const std::vector<ExistingElement>& existing) {
        return std::is_sorted(existing.begin(), existing.end(),
                              [](const ExistingElement& a, const ExistingElement& b) {
                                  return a.key < b.key;
                              });
    }

} // anonymous namespace

MergeReport merge_elements_report(Container& container, std::vector<Element> new_elements,
                                  const KeySelector& key_of) {
    MergeReport report;
    auto items = sort_new_items(std::move(new_elements), key_of);

    bool retried = false;
    while (true) {
        const auto existing = key_existing(container, key_of);
        auto plan = plan_merge(container, existing, items, !retried);

        if (plan.disordered) {
            rebuild_sorted(container, existing);
            report.resorted = true;
            retried = true;
            continue;
        }

        for (const auto& insertion : plan.insertions) {
            report.inserted += insertion.items.size();
        }
        report.replaced = plan.replacements.size();
        report.changed = plan.changed || report.resorted;

        apply_plan(container, plan, items);
        return report;
    }
}

bool merge_elements(Container& container, std::vector<Element> new_elements,
                    const KeySelector& key_of) {
    return merge_elements_report(container, std::move(new_elements), key_of).changed;
}

bool is_sorted_by_key(const Container& container, const KeySelector& key_of) {
    return keys_sorted(key_existing(container, key_of));
}

bool sort_elements(Container& container, const KeySelector& key_of) {
    const auto existing = key_existing(container, key_of);
    if (keys_sorted(existing)) {
        return false;
    }
    rebuild_sorted(container, existing);
    return true;
}

} // namespace tidymerge
