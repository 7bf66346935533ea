// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "column_registry.h"
#include <algorithm>
#include <cassert>
#include <unordered_set>
#include <utility>
#include "table_error.h"

using namespace frost;


void ColumnRegistry::insert(size_t pos, const Column& col)
{
    if (col.name.empty() || findByName(col.name) >= 0)
        FROST_THROW_CONTRACT_VIOLATION();

    pos = std::min(pos, columns_.size());
    columns_.insert(columns_.begin() + pos, col);
    invalidate();
}


void ColumnRegistry::remove(size_t col)
{
    if (col < columns_.size())
    {
        columns_.erase(columns_.begin() + col);
        invalidate();
    }
}


void ColumnRegistry::move(size_t colFrom, size_t colTo)
{
    if (colFrom < columns_.size() &&
        colTo   < columns_.size() &&
        colTo != colFrom)
    {
        const Column colTmp = columns_[colFrom];
        columns_.erase (columns_.begin() + colFrom);
        columns_.insert(columns_.begin() + colTo, colTmp);
        invalidate();
    }
}


void ColumnRegistry::clear()
{
    columns_.clear();
    frozenMap_.displayNames.clear();
    normalMap_.displayNames.clear();
    invalidate();
}


int ColumnRegistry::findByName(const std::wstring& name) const
{
    auto it = std::find_if(columns_.begin(), columns_.end(), [&](const Column& c) { return c.name == name; });
    return it != columns_.end() ? static_cast<int>(it - columns_.begin()) : -1;
}


bool ColumnRegistry::setVisible(size_t col, bool visible)
{
    if (col >= columns_.size())
        return false;

    if (columns_[col].visible != visible)
    {
        columns_[col].visible = visible;
        invalidate();
    }
    return true;
}


bool ColumnRegistry::setFrozen(size_t col, bool frozen)
{
    if (col >= columns_.size())
        return false;

    if (columns_[col].frozen != frozen)
    {
        columns_[col].frozen = frozen;
        invalidate();
    }
    return true;
}


bool ColumnRegistry::setWidth(size_t col, int width)
{
    if (col >= columns_.size())
        return false;

    width = std::max(width, columns_[col].minWidth);
    if (columns_[col].width != width)
    {
        columns_[col].width = width;
        notifyChanged(); //geometry only: index maps stay valid
    }
    return true;
}


bool ColumnRegistry::setTitleOverride(size_t col, const std::wstring& title)
{
    if (col >= columns_.size())
        return false;

    if (columns_[col].titleOverride != title)
    {
        columns_[col].titleOverride = title;
        notifyChanged();
    }
    return true;
}


bool ColumnRegistry::setTitle(size_t col, const std::wstring& title)
{
    if (col >= columns_.size())
        return false;

    if (columns_[col].title != title)
    {
        columns_[col].title = title;
        notifyChanged();
    }
    return true;
}


std::vector<size_t> ColumnRegistry::visibleColumns() const
{
    std::vector<size_t> output;
    for (size_t col = 0; col < columns_.size(); ++col)
        if (columns_[col].visible)
            output.push_back(col);
    return output;
}


std::vector<size_t> ColumnRegistry::visibleColumnsInDisplayOrder() const
{
    std::vector<size_t> output;
    for (PaneId pane : {PaneId::frozen, PaneId::normal})
        for (const std::wstring& name : getMap(pane).displayNames)
            output.push_back(nameToLogical_.find(name)->second);
    return output;
}


int ColumnRegistry::frozenVisibleCount() const { return visibleCount(PaneId::frozen); }


int ColumnRegistry::visibleCount(PaneId pane) const
{
    return static_cast<int>(getMap(pane).visualToLogical.size());
}


int ColumnRegistry::toVisualIndex(size_t col) const
{
    updateMaps();
    return col < logicalToVisual_.size() ? logicalToVisual_[col] : -1;
}


int ColumnRegistry::toLogicalIndex(PaneId pane, int visualIdx) const
{
    const PaneMap& pm = getMap(pane);
    if (0 <= visualIdx && static_cast<size_t>(visualIdx) < pm.visualToLogical.size())
        return static_cast<int>(pm.visualToLogical[visualIdx]);
    return -1;
}


std::vector<int> ColumnRegistry::getDisplayOrder(PaneId pane) const
{
    std::vector<int> output;
    for (const std::wstring& name : getMap(pane).displayNames)
        output.push_back(logicalToVisual_[nameToLogical_.find(name)->second]);
    return output;
}


std::vector<std::wstring> ColumnRegistry::getDisplayNames(PaneId pane) const
{
    return getMap(pane).displayNames;
}


void ColumnRegistry::setDisplayNames(PaneId pane, const std::vector<std::wstring>& names)
{
    (pane == PaneId::frozen ? frozenMap_ : normalMap_).displayNames = names;
    invalidate(); //reconcile against visibility and pane membership
}


bool ColumnRegistry::moveInDisplayOrder(PaneId pane, size_t posFrom, size_t posTo)
{
    updateMaps();
    std::vector<std::wstring>& names = (pane == PaneId::frozen ? frozenMap_ : normalMap_).displayNames;

    if (posFrom >= names.size() || posTo >= names.size())
        return false;

    if (posFrom != posTo)
    {
        const std::wstring name = names[posFrom];
        names.erase (names.begin() + posFrom);
        names.insert(names.begin() + posTo, name);
        notifyChanged();
    }
    return true;
}


int ColumnRegistry::displayPosToLogical(PaneId pane, size_t pos) const
{
    const PaneMap& pm = getMap(pane);
    if (pos < pm.displayNames.size())
        return static_cast<int>(nameToLogical_.find(pm.displayNames[pos])->second);
    return -1;
}


void ColumnRegistry::endUpdate()
{
    assert(updateLevel_ > 0);
    if (--updateLevel_ == 0 && std::exchange(changePending_, false))
        notifyChanged();
}


void ColumnRegistry::notifyChanged()
{
    if (updateLevel_ > 0)
        changePending_ = true;
    else if (onChange_)
        onChange_();
}


void ColumnRegistry::invalidate()
{
    mapsValid_ = false;
    notifyChanged();
}


void ColumnRegistry::updateMaps() const
{
    if (mapsValid_)
        return;

    logicalToVisual_.assign(columns_.size(), -1);
    nameToLogical_.clear();
    frozenMap_.visualToLogical.clear();
    normalMap_.visualToLogical.clear();

    for (size_t col = 0; col < columns_.size(); ++col)
    {
        const Column& c = columns_[col];
        nameToLogical_.emplace(c.name, col);

        if (c.visible)
        {
            std::vector<size_t>& v2l = (c.frozen ? frozenMap_ : normalMap_).visualToLogical;
            logicalToVisual_[col] = static_cast<int>(v2l.size()); //rank among preceding visible columns of the same pane
            v2l.push_back(col);
        }
    }

    //keep existing display order, drop stale names, append new arrivals in logical order
    for (PaneMap* pm : {&frozenMap_, &normalMap_})
    {
        std::vector<std::wstring> names;
        std::unordered_set<std::wstring> usedNames;

        auto belongsHere = [&](size_t col)
        {
            return std::find(pm->visualToLogical.begin(), pm->visualToLogical.end(), col) != pm->visualToLogical.end();
        };

        for (const std::wstring& name : pm->displayNames)
            if (auto it = nameToLogical_.find(name);
                it != nameToLogical_.end() && belongsHere(it->second))
                if (usedNames.insert(name).second)
                    names.push_back(name);

        for (size_t col : pm->visualToLogical)
            if (usedNames.insert(columns_[col].name).second)
                names.push_back(columns_[col].name);

        pm->displayNames = std::move(names);
    }

    mapsValid_ = true;
}
