// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef DEMO_MODEL_H_2931846602718350492
#define DEMO_MODEL_H_2931846602718350492

#include <frost/pane.h>


namespace frost_demo
{
enum class DemoColumn
{
    id,
    name,
    size,
    modified,
    flag,
    progress,
};

std::vector<frost::Column> getDemoColumns();


//synthetic file listing: every capability a model may implement
class DemoModel :
    public frost::TableModel,
    public frost::Sorter,
    public frost::ItemChecker,
    public frost::ImageProvider,
    public frost::CellStyler
{
public:
    explicit DemoModel(size_t rowCount);

    size_t getRowCount() const override { return rows_.size(); }
    frost::CellValue getValue(size_t row, size_t col) const override;

    bool isColumnSortable(size_t col) const override;
    void sort(size_t col, frost::SortOrder order) override; //throw ModelError
    size_t getSortedColumn() const override { return sortCol_; }
    frost::SortOrder getSortOrder() const override { return sortOrder_; }

    bool isChecked(size_t row) const override { return rows_[row].checked; }
    void setChecked(size_t row, bool checked) override; //throw ModelError

    frost::ImageRef getImage(size_t row) const override;

    void styleCell(frost::CellStyle& style) const override;

    void appendRows(size_t count);
    void removeRows(size_t rowFrom, size_t rowTo);
    void touchRow(size_t row);

private:
    struct Row
    {
        int64_t id = 0;
        std::wstring name;
        double size = 0;
        time_t modified = 0;
        bool flag = false;
        bool checked = false;
        int progress = 0; //[0, 100]
        bool isFolder = false;
    };
    static Row makeRow(int64_t id);

    std::vector<Row> rows_; //in sort order

    size_t sortCol_ = static_cast<size_t>(DemoColumn::id);
    frost::SortOrder sortOrder_ = frost::SortOrder::ascending;

    std::shared_ptr<frost::WxImageSource> folderIcon_;
    std::shared_ptr<frost::WxImageSource> fileIcon_;
    std::shared_ptr<frost::WxCellPainter> progressPainter_;
};
}

#endif //DEMO_MODEL_H_2931846602718350492
