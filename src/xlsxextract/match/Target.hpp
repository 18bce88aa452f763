#pragma once

#include "xlsxextract/match/Match.hpp"
#include <optional>
#include <variant>

namespace xlsxextract {
namespace core {
class Workbook;
}

namespace match {

/**
 * @brief 从源工作簿取值写入目标工作簿
 *
 * 源和目标各自是单元格或区域；区域一侧可用行/列定位器在区域内找到一行、一列，
 * 两个都设置时取交叉单元格。构造时确定传输形状：
 * - CellCopy：单元格到单元格
 * - TableCopy：整表替换，可按源尺寸扩展目标
 * - VectorCopy：行/列向量复制，可转置，可按首行/首列标签对齐
 *
 * 所有解析先于任何修改，失败时目标工作簿保持不变。
 */
class Target {
public:
    struct Params {
        Params(Match source_match, Match target_match)
            : source(std::move(source_match)), target(std::move(target_match)) {}

        Match source;
        Match target;
        std::optional<CellMatch> source_row;
        std::optional<CellMatch> source_col;
        std::optional<CellMatch> target_row;
        std::optional<CellMatch> target_col;
        bool align = false;
        bool expand = false;
    };

    struct CellCopy {};
    struct TableCopy {};
    struct VectorCopy {};
    using Shape = std::variant<CellCopy, TableCopy, VectorCopy>;

    /**
     * @throws core::ConfigurationException 源和目标形状不一致，或定位器用在单元格匹配上
     */
    explicit Target(Params params);

    /**
     * @brief 执行传输
     * @return 源的匹配结果；任何一步未命中时返回 std::nullopt
     * @throws core::ConfigurationException 解析后的形状不一致
     */
    std::optional<MatchResult> extract(const core::Workbook& source, core::Workbook& target) const;

    const Params& params() const { return params_; }
    const Shape& shape() const { return shape_; }

private:
    enum class Side { Cell, Vector, Table };

    // 解析后的一侧：单元格、向量或整表
    struct Resolved {
        core::Range table;
        Side side = Side::Cell;
        bool row_vector = false;
        int index = 0; // 向量在表内的行/列下标（基于0）
        core::CellAddress cell;
    };

    static Side sideOf(const Match& m, const std::optional<CellMatch>& row,
                       const std::optional<CellMatch>& col);

    std::optional<Resolved> resolveSide(const core::Range& range, bool is_range,
                                        const std::optional<CellMatch>& row_locator,
                                        const std::optional<CellMatch>& col_locator) const;

    void copyCell(const Resolved& src, const Resolved& dst) const;
    void copyTable(const Resolved& src, Resolved dst, core::Workbook& target) const;
    void copyVector(const Resolved& src, Resolved dst, core::Workbook& target) const;

    Params params_;
    Shape shape_;
};

}} // namespace xlsxextract::match
