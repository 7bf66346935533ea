// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef TABLE_MODEL_H_7720158342069174352
#define TABLE_MODEL_H_7720158342069174352

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <cstdint>
#include <zen/time.h>


//data model interfaces: a TableModel plus optional capabilities a model may implement in addition
namespace frost
{
using CellValue = std::variant<std::monostate, //empty cell
      std::wstring,
      int64_t,
      double,
      bool,
      zen::TimeComp>;


enum class SortOrder
{
    ascending,
    descending,
};


class TableModelObserver
{
public:
    virtual ~TableModelObserver() {}

    virtual void onRowsReset() = 0;
    virtual void onRowChanged(size_t row) = 0;
    virtual void onRowsInserted(size_t rowFrom, size_t rowTo) = 0; //inclusive range
    virtual void onRowsRemoved (size_t rowFrom, size_t rowTo) = 0; //
    virtual void onSortChanged() = 0;
};


class TableModel
{
public:
    virtual ~TableModel() {}

    virtual size_t getRowCount() const = 0;
    virtual CellValue getValue(size_t row, size_t col) const = 0;

    void attachObserver(TableModelObserver& obs);
    void detachObserver(TableModelObserver& obs);

protected:
    //call after the model data has changed:
    void notifyRowsReset();
    void notifyRowChanged(size_t row);
    void notifyRowsInserted(size_t rowFrom, size_t rowTo);
    void notifyRowsRemoved (size_t rowFrom, size_t rowTo);
    void notifySortChanged();

private:
    template <class Function>
    void forEachObserver(Function fun);

    std::vector<TableModelObserver*> observers_; //not owned
};

//------------------------------------------------------------------------------------

class Sorter
{
public:
    virtual ~Sorter() {}

    virtual bool isColumnSortable(size_t col) const = 0;
    virtual void sort(size_t col, SortOrder order) = 0; //throw ModelError; implementations call notifySortChanged()
    virtual size_t getSortedColumn() const = 0;
    virtual SortOrder getSortOrder() const = 0;
};


class ItemChecker
{
public:
    virtual ~ItemChecker() {}

    virtual bool isChecked(size_t row) const = 0;
    virtual void setChecked(size_t row, bool checked) = 0; //throw ModelError
};


//identity of an in-memory image is the object address; toolkits derive their image holder from this
class ImageSource
{
public:
    virtual ~ImageSource() {}
};

struct ImageRef
{
    std::shared_ptr<const ImageSource> source; //identified by address
    std::wstring filePath;                     //identified by path if "source" is empty

    bool empty() const { return !source && filePath.empty(); }
};


class ImageProvider
{
public:
    virtual ~ImageProvider() {}

    virtual ImageRef getImage(size_t row) const = 0; //row image shown in the first column
};


struct Color
{
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;

    bool operator==(const Color&) const = default;
};

inline bool isDarkColor(const Color& c) { return c.r + c.g + c.b < 3 * 128; }


struct FontStyle
{
    bool bold   = false;
    bool italic = false;
    int sizeDelta = 0; //points relative to the widget font

    bool operator==(const FontStyle&) const = default;
};


//paints a complete cell instead of the default rendering; toolkits derive their painter interface from this
class CellPainter
{
public:
    virtual ~CellPainter() {}
};


struct CellStyle
{
    size_t row = 0;
    size_t col = 0;

    std::optional<Color> background;
    std::optional<Color> textColor;
    std::optional<FontStyle> font;
    ImageRef image;
    std::shared_ptr<CellPainter> painter; //skips default drawing if set
};


class CellStyler
{
public:
    virtual ~CellStyler() {}

    virtual void styleCell(CellStyle& style) const = 0; //"style" comes pre-filled with the baseline
};


//on-demand bulk loading: the view asks to populate rows before querying their values
class Populator
{
public:
    virtual ~Populator() {}

    virtual bool needsPopulation(size_t row) const = 0;
    virtual void populate(size_t row) = 0; //throw ModelError
};
}

#endif //TABLE_MODEL_H_7720158342069174352
