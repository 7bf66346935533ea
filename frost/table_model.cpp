// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "table_model.h"
#include <algorithm>

using namespace frost;


void TableModel::attachObserver(TableModelObserver& obs)
{
    if (std::find(observers_.begin(), observers_.end(), &obs) == observers_.end())
        observers_.push_back(&obs);
}


void TableModel::detachObserver(TableModelObserver& obs)
{
    std::erase(observers_, &obs);
}


template <class Function> inline
void TableModel::forEachObserver(Function fun)
{
    //observers may detach while being notified => iterate over a snapshot
    const std::vector<TableModelObserver*> observers = observers_;
    for (TableModelObserver* obs : observers)
        if (std::find(observers_.begin(), observers_.end(), obs) != observers_.end())
            fun(*obs);
}


void TableModel::notifyRowsReset()                             { forEachObserver([&](TableModelObserver& obs) { obs.onRowsReset(); }); }
void TableModel::notifyRowChanged(size_t row)                  { forEachObserver([&](TableModelObserver& obs) { obs.onRowChanged(row); }); }
void TableModel::notifyRowsInserted(size_t rowFrom, size_t rowTo) { forEachObserver([&](TableModelObserver& obs) { obs.onRowsInserted(rowFrom, rowTo); }); }
void TableModel::notifyRowsRemoved (size_t rowFrom, size_t rowTo) { forEachObserver([&](TableModelObserver& obs) { obs.onRowsRemoved(rowFrom, rowTo); }); }
void TableModel::notifySortChanged()                           { forEachObserver([&](TableModelObserver& obs) { obs.onSortChanged(); }); }
