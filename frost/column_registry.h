// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef COLUMN_REGISTRY_H_2307461938475619823
#define COLUMN_REGISTRY_H_2307461938475619823

#include <string>
#include <vector>
#include <functional>
#include <unordered_map>


namespace frost
{
enum class PaneId
{
    frozen,
    normal,
};

inline PaneId otherPane(PaneId pane) { return pane == PaneId::frozen ? PaneId::normal : PaneId::frozen; }


enum class CellAlignment
{
    left,
    center,
    right,
};


struct Column
{
    std::wstring name;          //stable identity: unique and non-empty
    std::wstring title;
    std::wstring titleOverride; //user-assigned, persisted
    std::wstring format;        //"%x" pattern for generic values, strftime pattern for time values
    int precision = 0;          //fraction digits for floating values; 0 => default of 2
    int width     = 100;
    int minWidth  = 20;
    bool frozen   = false;
    bool visible  = true;
    CellAlignment alignment = CellAlignment::left;

    const std::wstring& getEffectiveTitle() const { return titleOverride.empty() ? title : titleOverride; }

    bool operator==(const Column&) const = default;
};

/*  Logical index: position in the master column sequence; stable identity for the model and for events.
    Visual index:  0-based rank among the visible columns of the same pane, counted in logical order;
                   this is the "sub-item" index each pane renders a column under.
    Display order: left-to-right arrangement of a pane's visible columns, independent of the logical order.  */
class ColumnRegistry
{
public:
    size_t size() const { return columns_.size(); }
    bool empty() const { return columns_.empty(); }

    const Column& getColumn(size_t col) const { return columns_[col]; } //precondition: col < size()
    const std::vector<Column>& getColumns() const { return columns_; }

    void add(const Column& col) { insert(columns_.size(), col); }
    void insert(size_t pos, const Column& col);
    void remove(size_t col);
    void move(size_t colFrom, size_t colTo);
    void clear();

    int findByName(const std::wstring& name) const; //return -1 if not found

    //mutators return "false" if column index is out of range
    bool setVisible      (size_t col, bool visible);
    bool setFrozen       (size_t col, bool frozen);
    bool setWidth        (size_t col, int width);
    bool setTitleOverride(size_t col, const std::wstring& title);
    bool setTitle        (size_t col, const std::wstring& title);

    std::vector<size_t> visibleColumns() const; //logical indices in logical order
    std::vector<size_t> visibleColumnsInDisplayOrder() const; //frozen pane first, each pane in display order
    int frozenVisibleCount() const;
    int visibleCount(PaneId pane) const;

    int    toVisualIndex(size_t col) const; //return -1 if not visible
    PaneId getPane      (size_t col) const { return columns_[col].frozen ? PaneId::frozen : PaneId::normal; }
    int    toLogicalIndex(PaneId pane, int visualIdx) const; //return -1 on miss

    //display order: visual indices of one pane, left to right
    std::vector<int> getDisplayOrder(PaneId pane) const;
    std::vector<std::wstring> getDisplayNames(PaneId pane) const;
    void setDisplayNames(PaneId pane, const std::vector<std::wstring>& names); //unknown/invisible names are ignored, missing ones are appended
    bool moveInDisplayOrder(PaneId pane, size_t posFrom, size_t posTo);
    int  displayPosToLogical(PaneId pane, size_t pos) const; //return -1 on miss

    //notified after every mutation: visibility, frozen state, order, width, titles
    void setChangeCallback(const std::function<void()>& onChange) { onChange_ = onChange; }

    //coalesce notifications: one callback at the end of the outermost update
    void beginUpdate() { ++updateLevel_; }
    void endUpdate();

private:
    struct PaneMap
    {
        std::vector<size_t> visualToLogical;
        std::vector<std::wstring> displayNames;
    };

    void invalidate();
    void notifyChanged();
    void updateMaps() const;
    const PaneMap& getMap(PaneId pane) const { updateMaps(); return pane == PaneId::frozen ? frozenMap_ : normalMap_; }

    std::vector<Column> columns_;

    //lazily derived from columns_:
    mutable bool mapsValid_ = true;
    mutable std::vector<int> logicalToVisual_;
    mutable std::unordered_map<std::wstring, size_t> nameToLogical_;
    mutable PaneMap frozenMap_;
    mutable PaneMap normalMap_;

    std::function<void()> onChange_;
    int  updateLevel_ = 0;
    bool changePending_ = false;
};


class ColumnUpdateScope
{
public:
    explicit ColumnUpdateScope(ColumnRegistry& reg) : reg_(reg) { reg_.beginUpdate(); }
    ~ColumnUpdateScope() { reg_.endUpdate(); }

private:
    ColumnUpdateScope           (const ColumnUpdateScope&) = delete;
    ColumnUpdateScope& operator=(const ColumnUpdateScope&) = delete;

    ColumnRegistry& reg_;
};
}

#endif //COLUMN_REGISTRY_H_2307461938475619823
