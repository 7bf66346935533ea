// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "demo_model.h"
#include <algorithm>
#include <iterator>
#include <wx/artprov.h>
#include <wx/settings.h>
#include <zen/i18n.h>
#include <zen/string_tools.h>
#include <frost/dc.h>
#include <frost/table_error.h>

using namespace zen;
using namespace frost;
using namespace frost_demo;


namespace
{
const time_t DEMO_TIME_BASE = 1'600'000'000; //2020-09-13

const wchar_t* const nameParts[] = { L"alpha", L"bravo", L"charlie", L"delta", L"echo", L"foxtrot", L"golf", L"hotel" };


class ProgressPainter : public WxCellPainter
{
public:
    void paint(wxDC& dc, const wxRect& rect, const CellStyle& style, bool selected) override
    {
        const int progress = rowProgress_ ? rowProgress_(style.row) : 0;

        clearArea(dc, rect, selected ? wxColor(225, 234, 255) : wxSystemSettings::GetColour(wxSYS_COLOUR_WINDOW));

        const wxRect bar = rect.Deflate(dipToWxsize(3), dipToWxsize(4));
        drawRectangleBorder(dc, bar, wxSystemSettings::GetColour(wxSYS_COLOUR_BTNSHADOW), dipToWxsize(1));
        clearArea(dc, wxRect(bar.x, bar.y, bar.width * progress / 100, bar.height), {82, 178, 99});

        drawTextTruncated(dc, bar, numberTo<std::wstring>(progress) + L'%', wxALIGN_CENTER);
    }

    std::function<int(size_t row)> rowProgress_;
};


template <class T>
int compareValues(const T& lhs, const T& rhs) { return lhs < rhs ? -1 : (rhs < lhs ? 1 : 0); }
}


std::vector<Column> frost_demo::getDemoColumns()
{
    std::vector<Column> cols;

    Column id;
    id.name  = L"id";
    id.title = _("ID");
    id.format = L"#%x";
    id.width  = 90;
    id.frozen = true;
    id.alignment = CellAlignment::right;
    cols.push_back(id);

    Column name;
    name.name  = L"name";
    name.title = _("Name");
    name.width = 220;
    name.frozen = true;
    cols.push_back(name);

    Column size;
    size.name  = L"size";
    size.title = _("Size (KB)");
    size.precision = 1;
    size.width = 110;
    size.alignment = CellAlignment::right;
    cols.push_back(size);

    Column modified;
    modified.name  = L"modified";
    modified.title = _("Modified");
    modified.format = L"%Y-%m-%d %H:%M";
    modified.width = 140;
    cols.push_back(modified);

    Column flag;
    flag.name  = L"flag";
    flag.title = _("Flag");
    flag.width = 50;
    flag.alignment = CellAlignment::center;
    cols.push_back(flag);

    Column progress;
    progress.name  = L"progress";
    progress.title = _("Progress");
    progress.width = 140;
    cols.push_back(progress);

    return cols;
}


DemoModel::DemoModel(size_t rowCount) :
    folderIcon_(std::make_shared<WxImageSource>(wxArtProvider::GetBitmap(wxART_FOLDER,      wxART_LIST, wxSize(16, 16)))),
    fileIcon_  (std::make_shared<WxImageSource>(wxArtProvider::GetBitmap(wxART_NORMAL_FILE, wxART_LIST, wxSize(16, 16))))
{
    auto painter = std::make_shared<ProgressPainter>();
    painter->rowProgress_ = [this](size_t row) { return row < rows_.size() ? rows_[row].progress : 0; };
    progressPainter_ = painter;

    rows_.reserve(rowCount);
    for (size_t i = 0; i < rowCount; ++i)
        rows_.push_back(makeRow(i + 1));
}


DemoModel::Row DemoModel::makeRow(int64_t id)
{
    Row r;
    r.id       = id;
    r.name     = std::wstring(nameParts[id % std::size(nameParts)]) + L'_' + numberTo<std::wstring>(id);
    r.isFolder = id % 7 == 0;
    r.size     = r.isFolder ? 0 : static_cast<double>((id * 7919) % 100'000) / 3.0;
    r.modified = DEMO_TIME_BASE + static_cast<time_t>(id) * 3637;
    r.flag     = id % 5 == 0;
    r.progress = static_cast<int>((id * 37) % 101);
    return r;
}


CellValue DemoModel::getValue(size_t row, size_t col) const
{
    if (row >= rows_.size())
        return {};

    const Row& r = rows_[row];
    switch (static_cast<DemoColumn>(col))
    {
        case DemoColumn::id:
            return r.id;
        case DemoColumn::name:
            return r.name;
        case DemoColumn::size:
            if (r.isFolder)
                return {};
            return r.size;
        case DemoColumn::modified:
            return getLocalTime(r.modified);
        case DemoColumn::flag:
            return r.flag;
        case DemoColumn::progress:
            return static_cast<int64_t>(r.progress); //drawn by ProgressPainter
    }
    return {};
}


bool DemoModel::isColumnSortable(size_t col) const
{
    return static_cast<DemoColumn>(col) != DemoColumn::progress;
}


void DemoModel::sort(size_t col, SortOrder order) //throw ModelError
{
    if (!isColumnSortable(col))
        throw ModelError(replaceCpy(_("Cannot sort by column %x."), L"%x", numberTo<std::wstring>(col)));

    auto compare = [col](const Row& lhs, const Row& rhs)
    {
        switch (static_cast<DemoColumn>(col))
        {
            case DemoColumn::id:
                return compareValues(lhs.id, rhs.id);
            case DemoColumn::name:
                return compareValues(lhs.name, rhs.name);
            case DemoColumn::size:
                return compareValues(lhs.size, rhs.size);
            case DemoColumn::modified:
                return compareValues(lhs.modified, rhs.modified);
            case DemoColumn::flag:
                return compareValues(lhs.flag, rhs.flag);
            case DemoColumn::progress:
                break;
        }
        return 0;
    };

    std::stable_sort(rows_.begin(), rows_.end(), [&](const Row& lhs, const Row& rhs)
    {
        const int cmp = compare(lhs, rhs);
        return order == SortOrder::ascending ? cmp < 0 : cmp > 0;
    });

    sortCol_   = col;
    sortOrder_ = order;
    notifySortChanged();
}


void DemoModel::setChecked(size_t row, bool checked) //throw ModelError
{
    if (row >= rows_.size())
        throw ModelError(replaceCpy(_("Row %x does not exist."), L"%x", numberTo<std::wstring>(row)));

    rows_[row].checked = checked;
}


ImageRef DemoModel::getImage(size_t row) const
{
    if (row < rows_.size())
        return {rows_[row].isFolder ? folderIcon_ : fileIcon_, {}};
    return {};
}


void DemoModel::styleCell(CellStyle& style) const
{
    if (style.row >= rows_.size())
        return;
    const Row& r = rows_[style.row];

    switch (static_cast<DemoColumn>(style.col))
    {
        case DemoColumn::name:
            if (r.isFolder)
                style.font = FontStyle{.bold = true};
            break;

        case DemoColumn::size:
            if (r.size > 30'000)
                style.textColor = Color{196, 0, 0};
            break;

        case DemoColumn::flag:
            if (r.flag)
                style.background = Color{255, 244, 192};
            break;

        case DemoColumn::progress:
            style.painter = progressPainter_;
            break;

        case DemoColumn::id:
        case DemoColumn::modified:
            break;
    }
}


void DemoModel::appendRows(size_t count)
{
    if (count == 0)
        return;

    const size_t rowFrom = rows_.size();
    const int64_t idFirst = rows_.empty() ? 1 : std::max_element(rows_.begin(), rows_.end(), [](const Row& lhs, const Row& rhs) { return lhs.id < rhs.id; })->id + 1;

    for (size_t i = 0; i < count; ++i)
        rows_.push_back(makeRow(idFirst + i));

    notifyRowsInserted(rowFrom, rows_.size() - 1);
}


void DemoModel::removeRows(size_t rowFrom, size_t rowTo)
{
    if (rowFrom > rowTo || rowTo >= rows_.size())
        return;

    rows_.erase(rows_.begin() + rowFrom, rows_.begin() + rowTo + 1);
    notifyRowsRemoved(rowFrom, rowTo);
}


void DemoModel::touchRow(size_t row)
{
    if (row < rows_.size())
    {
        rows_[row].progress = (rows_[row].progress + 10) % 101;
        rows_[row].modified = std::time(nullptr);
        notifyRowChanged(row);
    }
}
