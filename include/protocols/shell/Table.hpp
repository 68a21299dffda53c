#pragma once

#include <algorithm>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace sw::shell {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t max = 60;            // longer cells are clamped with "..." in the middle
};

class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells) {
        cells.resize(cols_.size());
        rows_.push_back(std::move(cells));
    }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        std::vector<std::size_t> width(cols_.size(), 0);
        for (std::size_t i = 0; i < cols_.size(); ++i) width[i] = std::min(cols_[i].max, cols_[i].header.size());
        for (const auto& r : rows_)
            for (std::size_t i = 0; i < cols_.size(); ++i)
                width[i] = std::max(width[i], std::min(cols_[i].max, r[i].size()));

        std::string out;
        out.reserve(128 + rows_.size() * 96);

        std::vector<std::string> header;
        header.reserve(cols_.size());
        for (const auto& c : cols_) header.push_back(c.header);
        out += line(header, width);

        std::string rule = "  ";
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) rule += "  ";
            rule += std::string(width[i], '-');
        }
        out += rule + "\n";

        for (const auto& r : rows_) out += line(r, width);
        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;

    static std::string clamp(const std::string& s, const std::size_t max) {
        if (s.size() <= max) return s;
        if (max <= 3) return s.substr(0, max);
        const std::size_t keep = max - 3;
        const std::size_t head = (keep + 1) / 2;
        return s.substr(0, head) + "..." + s.substr(s.size() - (keep - head));
    }

    [[nodiscard]] std::string line(const std::vector<std::string>& cells, const std::vector<std::size_t>& width) const {
        std::string out = "  ";
        for (std::size_t i = 0; i < cols_.size(); ++i) {
            if (i) out += "  ";
            const auto text = clamp(cells[i], cols_[i].max);
            out += cols_[i].align == Align::Left ? fmt::format("{:<{}}", text, width[i])
                                                 : fmt::format("{:>{}}", text, width[i]);
        }
        while (!out.empty() && out.back() == ' ') out.pop_back();
        return out + "\n";
    }
};

}
