// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef DATA_BRIDGE_H_1846302759910273645
#define DATA_BRIDGE_H_1846302759910273645

#include <map>
#include <memory>
#include <functional>
#include "cell_format.h"
#include "selection.h"


namespace frost
{
//toolkit image store: images are appended once and referenced by index afterwards
class ImageList
{
public:
    virtual ~ImageList() {}

    virtual int addImage(const ImageRef& img) = 0; //return -1 if image is not available
};


struct SortState
{
    size_t column = 0;
    SortOrder order = SortOrder::ascending;

    bool operator==(const SortState&) const = default;
};


/*  answers the panes' per-cell queries from the model on demand (no row cache) and
    translates model notifications into row count, redraw and selection updates        */
class DataBridge : private TableModelObserver
{
public:
    DataBridge(const ColumnRegistry& columns, PanePair& panes, SelectionController& selection) :
        columns_(columns), panes_(panes), selection_(selection) {}
    ~DataBridge();

    //--------------------- model ---------------------
    TableModel* getModel() const { return model_; }
    void setModel(TableModel* model); //throw ModelError, NativeError; model not owned, nullptr: detach

    Sorter*        getSorter       () const { return sorter_; }
    ItemChecker*   getItemChecker  () const { return itemChecker_; }
    ImageProvider* getImageProvider() const { return imageProvider_; }
    CellStyler*    getCellStyler   () const { return styler_; }
    Populator*     getPopulator    () const { return populator_; }

    void setItemChecker(ItemChecker* checker) { itemChecker_ = checker; }
    void setCellStyler (CellStyler*  styler ) { styler_ = styler; } //survives model replacement

    size_t getRowCount() const { return model_ ? model_->getRowCount() : 0; }

    //--------------------- cell queries ---------------------
    void prepareRows(size_t rowFirst, size_t rowLast); //throw ModelError; let a Populator load rows before they are painted
    std::wstring getCellText(size_t row, size_t col) const;
    std::optional<bool> getChecked(size_t row, size_t col) const; //first column only; no value if no checker
    int getImageIndex(size_t row, size_t col); //return -1 if no image
    const ImageList* getImageList() const { return imageList_.get(); }
    CellStyle getCellStyle(size_t row, size_t col) const;

    void setImageListFactory(const std::function<std::unique_ptr<ImageList>()>& factory) { imageListFactory_ = factory; }

    std::optional<Color> getAlternatingRowColor() const { return altRowColor_; }
    void setAlternatingRowColor(const std::optional<Color>& color) { altRowColor_ = color; }

    const NumberSymbols& getNumberSymbols() const { return numberSymbols_; }
    void setNumberSymbols(const NumberSymbols& sym) { numberSymbols_ = sym; }

    //--------------------- sorting ---------------------
    const SortState& getSortState() const { return sortState_; }
    void sort(const SortState& state); //throw ModelError

    bool isSortableByHeaderClick() const { return sortableByHeaderClick_; }
    void setSortableByHeaderClick(bool sortable) { sortableByHeaderClick_ = sortable; }

    void onColumnHeaderClicked(size_t col); //throw ModelError
    std::function<void(size_t col)> onColumnClicked;

    void updateSortIndicator();

    //--------------------- row updates ---------------------
    void toggleChecked(size_t row); //throw ModelError
    void updateItem(size_t row);    //throw ModelError
    void redrawAll();

private:
    DataBridge           (const DataBridge&) = delete;
    DataBridge& operator=(const DataBridge&) = delete;

    void onRowsReset() override;
    void onRowChanged(size_t row) override;
    void onRowsInserted(size_t rowFrom, size_t rowTo) override;
    void onRowsRemoved (size_t rowFrom, size_t rowTo) override;
    void onSortChanged() override;

    void detachModel();
    void updateRowCount();
    void releaseImages();
    int lookupImage(const ImageRef& img);

    const ColumnRegistry& columns_;
    PanePair& panes_;
    SelectionController& selection_;

    TableModel* model_ = nullptr;
    Sorter*        sorter_        = nullptr;
    ItemChecker*   itemChecker_   = nullptr;
    ImageProvider* imageProvider_ = nullptr;
    CellStyler*    styler_        = nullptr;
    Populator*     populator_     = nullptr;

    std::optional<Color> altRowColor_;
    NumberSymbols numberSymbols_;

    SortState sortState_;
    bool sortableByHeaderClick_ = true;

    //created on first image, released when the model is replaced:
    std::function<std::unique_ptr<ImageList>()> imageListFactory_;
    std::unique_ptr<ImageList> imageList_;
    std::map<std::shared_ptr<const ImageSource>, int> sourceToIndex_; //holds a reference: address identity stays unique
    std::map<std::wstring, int> pathToIndex_;
};
}

#endif //DATA_BRIDGE_H_1846302759910273645
