#pragma once

/**
 * @file ElementPartMapper.hpp
 * @brief Element and node to owning-part index
 *
 * Built once per run from d3hsp controlling-element records, the smallest
 * timestep table, and keyword-deck element cards. Read-only afterwards;
 * missing data answers "unknown part" (nullopt).
 */

#include <dynadiag/records/Records.hpp>

#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace dynadiag {

class ElementPartMapper {
  public:
    /**
     * @brief Accumulates associations; the first writer for an id wins
     */
    class Builder {
      public:
        Builder &AddElement(ElementId element, PartId part) {
            elements_.try_emplace(element, part);
            return *this;
        }

        Builder &AddNode(NodeId node, PartId part) {
            nodes_.try_emplace(node, part);
            return *this;
        }

        Builder &AddPartTitle(PartId part, std::string title) {
            if (!title.empty()) {
                titles_.try_emplace(part, std::move(title));
            }
            return *this;
        }

        Builder &Add(const TimestepRecord &record) {
            if (record.element != 0) {
                AddElement(record.element, record.part);
            }
            return *this;
        }

        Builder &Add(const ElementTimestep &entry) { return AddElement(entry.element, entry.part); }

        Builder &Add(const DeckElement &element) {
            AddElement(element.element, element.part);
            for (auto node : element.nodes) {
                AddNode(node, element.part);
            }
            return *this;
        }

        [[nodiscard]] ElementPartMapper Build() && {
            return ElementPartMapper(std::move(elements_), std::move(nodes_), std::move(titles_));
        }

      private:
        std::unordered_map<ElementId, PartId> elements_;
        std::unordered_map<NodeId, PartId> nodes_;
        std::map<PartId, std::string> titles_;
    };

    ElementPartMapper() = default;

    [[nodiscard]] std::optional<PartId> OwningPart(ElementId element) const {
        auto it = elements_.find(element);
        if (it == elements_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::optional<PartId> NodeOwningPart(NodeId node) const {
        auto it = nodes_.find(node);
        if (it == nodes_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::optional<std::string> PartTitle(PartId part) const {
        auto it = titles_.find(part);
        if (it == titles_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] std::size_t ElementCount() const { return elements_.size(); }
    [[nodiscard]] std::size_t NodeCount() const { return nodes_.size(); }
    [[nodiscard]] bool Empty() const { return elements_.empty() && nodes_.empty(); }

  private:
    ElementPartMapper(std::unordered_map<ElementId, PartId> elements,
                      std::unordered_map<NodeId, PartId> nodes,
                      std::map<PartId, std::string> titles)
        : elements_(std::move(elements)), nodes_(std::move(nodes)), titles_(std::move(titles)) {}

    std::unordered_map<ElementId, PartId> elements_;
    std::unordered_map<NodeId, PartId> nodes_;
    std::map<PartId, std::string> titles_;
};

} // namespace dynadiag
