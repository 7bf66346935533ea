// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "data_bridge.h"

using namespace frost;


DataBridge::~DataBridge()
{
    detachModel();
}


void DataBridge::setModel(TableModel* model) //throw ModelError, NativeError
{
    RedrawSuspension rs(panes_);

    if (model_)
    {
        detachModel();
        releaseImages();
    }

    //a styler set explicitly survives, a styler provided by the old model is replaced
    CellStyler* oldModelStyler = dynamic_cast<CellStyler*>(model_);
    CellStyler* newModelStyler = dynamic_cast<CellStyler*>(model);
    if (newModelStyler || styler_ == oldModelStyler)
        styler_ = newModelStyler;

    model_         = model;
    sorter_        = dynamic_cast<Sorter*       >(model);
    itemChecker_   = dynamic_cast<ItemChecker*  >(model);
    imageProvider_ = dynamic_cast<ImageProvider*>(model);
    populator_     = dynamic_cast<Populator*    >(model);

    if (model_)
    {
        model_->attachObserver(*this);

        if (sorter_)
            sorter_->sort(sortState_.column, sortState_.order); //throw ModelError
    }

    selection_.setCurrentIndex(-1); //throw NativeError
    updateRowCount();
    updateSortIndicator();
}


void DataBridge::detachModel()
{
    if (model_)
        model_->detachObserver(*this);
}


void DataBridge::updateRowCount()
{
    const size_t rowCount = getRowCount();
    panes_.frozen().setRowCount(rowCount);
    panes_.normal().setRowCount(rowCount);
}


void DataBridge::releaseImages()
{
    imageList_.reset();
    sourceToIndex_.clear();
    pathToIndex_  .clear();
}


void DataBridge::prepareRows(size_t rowFirst, size_t rowLast) //throw ModelError
{
    if (populator_)
        for (size_t row = rowFirst; row <= rowLast; ++row)
            if (populator_->needsPopulation(row))
                populator_->populate(row); //throw ModelError
}


std::wstring DataBridge::getCellText(size_t row, size_t col) const
{
    if (!model_ || col >= columns_.size())
        return std::wstring();

    return formatCellValue(model_->getValue(row, col), columns_.getColumn(col), numberSymbols_);
}


std::optional<bool> DataBridge::getChecked(size_t row, size_t col) const
{
    if (col == 0 && itemChecker_)
        return itemChecker_->isChecked(row);
    return {};
}


int DataBridge::getImageIndex(size_t row, size_t col)
{
    ImageRef img;

    if (col == 0 && imageProvider_)
        img = imageProvider_->getImage(row);

    if (img.empty() && styler_)
        img = getCellStyle(row, col).image;

    if (img.empty())
        return -1;

    return lookupImage(img);
}


int DataBridge::lookupImage(const ImageRef& img)
{
    if (!imageList_)
    {
        if (!imageListFactory_)
            return -1;
        imageList_ = imageListFactory_();
    }

    auto addOnce = [&](auto& cache, const auto& key)
    {
        auto it = cache.find(key);
        if (it == cache.end())
            it = cache.emplace(key, imageList_->addImage(img)).first; //cache failures, too
        return it->second;
    };

    if (img.source)
        return addOnce(sourceToIndex_, img.source);
    else
        return addOnce(pathToIndex_, img.filePath);
}


CellStyle DataBridge::getCellStyle(size_t row, size_t col) const
{
    CellStyle style;
    style.row = row;
    style.col = col;

    if (altRowColor_ && row % 2 == 1)
    {
        style.background = *altRowColor_;
        if (isDarkColor(*altRowColor_))
            style.textColor = Color{255, 255, 255};
    }

    if (styler_)
        styler_->styleCell(style);

    return style;
}


void DataBridge::sort(const SortState& state) //throw ModelError
{
    if (sorter_)
        sorter_->sort(state.column, state.order); //throw ModelError

    sortState_ = state;
}


void DataBridge::onColumnHeaderClicked(size_t col) //throw ModelError
{
    if (sorter_ && sortableByHeaderClick_ && sorter_->isColumnSortable(col))
    {
        const SortOrder order = col != sorter_->getSortedColumn() || sorter_->getSortOrder() == SortOrder::descending ?
                                SortOrder::ascending : SortOrder::descending;
        sort({col, order}); //throw ModelError
    }

    if (onColumnClicked)
        onColumnClicked(col);
}


void DataBridge::updateSortIndicator()
{
    panes_.frozen().setSortIndicator(-1, SortOrder::ascending);
    panes_.normal().setSortIndicator(-1, SortOrder::ascending);

    if (sorter_)
    {
        const size_t col = sorter_->getSortedColumn();
        if (col < columns_.size())
            if (const int visualIdx = columns_.toVisualIndex(col);
                visualIdx >= 0)
                panes_[columns_.getPane(col)].setSortIndicator(visualIdx, sorter_->getSortOrder());
    }
}


void DataBridge::toggleChecked(size_t row) //throw ModelError
{
    if (!itemChecker_)
        return;

    itemChecker_->setChecked(row, !itemChecker_->isChecked(row)); //throw ModelError

    panes_.frozen().redrawRow(row);
    panes_.normal().redrawRow(row);
}


void DataBridge::updateItem(size_t row) //throw ModelError
{
    if (sorter_)
    {
        sorter_->sort(sorter_->getSortedColumn(), sorter_->getSortOrder()); //throw ModelError
        redrawAll();
    }
    else
    {
        panes_.frozen().redrawRow(row);
        panes_.normal().redrawRow(row);
    }
}


void DataBridge::redrawAll()
{
    panes_.frozen().redrawAll();
    panes_.normal().redrawAll();
}


void DataBridge::onRowsReset()
{
    updateRowCount();
    selection_.onRowsReset(); //throw NativeError
}


void DataBridge::onRowChanged(size_t row)
{
    updateItem(row); //throw ModelError
}


void DataBridge::onRowsInserted(size_t rowFrom, size_t rowTo)
{
    updateRowCount();
    selection_.onRowsInserted(rowFrom, rowTo); //throw NativeError
}


void DataBridge::onRowsRemoved(size_t rowFrom, size_t rowTo)
{
    updateRowCount();
    selection_.onRowsRemoved(rowFrom, rowTo); //throw NativeError
}


void DataBridge::onSortChanged()
{
    updateSortIndicator();
    redrawAll();
}
