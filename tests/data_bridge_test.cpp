// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include <gtest/gtest.h>
#include <frost/data_bridge.h>
#include "fakes.h"

using namespace frost;
using namespace frost_test;


namespace
{
class CountingImageList : public ImageList
{
public:
    explicit CountingImageList(int& addCount) : addCount_(addCount) {}

    int addImage(const ImageRef& img) override { return addCount_++; }

private:
    int& addCount_;
};


class RedTextStyler : public CellStyler
{
public:
    void styleCell(CellStyle& style) const override
    {
        if (style.col == 1)
            style.textColor = Color{255, 0, 0};
    }
};


class StylingModel : public PlainModel, public CellStyler
{
public:
    StylingModel() : PlainModel(3) {}
    void styleCell(CellStyle& style) const override { style.font = FontStyle{true}; }
};


class LazyModel : public PlainModel, public Populator
{
public:
    LazyModel() : PlainModel(10) {}

    bool needsPopulation(size_t row) const override { return !loaded.contains(row); }
    void populate(size_t row) override { loaded.insert(row); ++populateCalls; }

    std::set<size_t> loaded;
    int populateCalls = 0;
};


std::vector<std::vector<CellValue>> makeRows(size_t rowCount)
{
    std::vector<std::vector<CellValue>> rows;
    for (size_t row = 0; row < rowCount; ++row)
        rows.push_back({std::wstring(L"row") + std::to_wstring(row), static_cast<int64_t>(row), static_cast<double>(row) / 2});
    return rows;
}
}


class DataBridgeTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        reg.add(makeColumn(L"a", true));
        reg.add(makeColumn(L"b"));
        reg.add(makeColumn(L"c"));

        bridge.onColumnClicked = [this](size_t col) { clickedColumns.push_back(col); };
        bridge.setImageListFactory([this] { return std::make_unique<CountingImageList>(imageAddCount); });
    }

    void TearDown() override { bridge.setModel(nullptr); } //models are destroyed before the bridge

    ColumnRegistry reg;
    FakePanes panes;
    ManualScheduler sched;
    SelectionController sel{panes.pair, sched};
    DataBridge bridge{reg, panes.pair, sel};

    VectorModel model{makeRows(5)};
    std::vector<size_t> clickedColumns;
    int imageAddCount = 0;
};


TEST_F(DataBridgeTest, SetModelSortsAndSizesPanes)
{
    bridge.setModel(&model);

    EXPECT_EQ(bridge.getRowCount(), 5u);
    EXPECT_EQ(panes.frozen.selected.size(), 5u);
    EXPECT_EQ(panes.normal.selected.size(), 5u);

    ASSERT_EQ(model.sortCalls.size(), 1u);
    EXPECT_EQ(model.sortCalls[0], std::make_pair(size_t(0), SortOrder::ascending));

    EXPECT_EQ(bridge.getSorter(), &model);
    EXPECT_EQ(bridge.getItemChecker(), &model);
    EXPECT_EQ(bridge.getImageProvider(), &model);
    EXPECT_EQ(bridge.getPopulator(), nullptr);

    EXPECT_EQ(panes.frozen.sortIndicator, std::make_pair(0, SortOrder::ascending));
    EXPECT_EQ(panes.normal.sortIndicator.first, -1);
    EXPECT_EQ(panes.frozen.suspendLevel, 0);
    EXPECT_EQ(sel.getCurrentIndex(), -1);
}


TEST_F(DataBridgeTest, SetModelPropagatesSortFailure)
{
    model.failSort = true;
    EXPECT_THROW(bridge.setModel(&model), ModelError);
    EXPECT_EQ(panes.normal.suspendLevel, 0);
}


TEST_F(DataBridgeTest, DetachModel)
{
    bridge.setModel(&model);
    bridge.setModel(nullptr);

    EXPECT_EQ(bridge.getRowCount(), 0u);
    EXPECT_EQ(bridge.getSorter(), nullptr);
    EXPECT_EQ(bridge.getCellText(0, 0), L"");

    model.insertRows(0, 2); //no longer observed
    EXPECT_EQ(panes.normal.selected.size(), 0u);
}


TEST_F(DataBridgeTest, HeaderClickTogglesSortOrder)
{
    bridge.setModel(&model);

    bridge.onColumnHeaderClicked(1);
    EXPECT_EQ(bridge.getSortState(), (SortState{1, SortOrder::ascending}));

    bridge.onColumnHeaderClicked(1);
    EXPECT_EQ(bridge.getSortState(), (SortState{1, SortOrder::descending}));

    bridge.onColumnHeaderClicked(1);
    EXPECT_EQ(bridge.getSortState(), (SortState{1, SortOrder::ascending}));

    bridge.onColumnHeaderClicked(2);
    EXPECT_EQ(bridge.getSortState(), (SortState{2, SortOrder::ascending}));

    EXPECT_EQ(clickedColumns, (std::vector<size_t> {1, 1, 1, 2}));

    //indicator belongs to the pane owning the column
    EXPECT_EQ(panes.normal.sortIndicator, std::make_pair(1, SortOrder::ascending));
    EXPECT_EQ(panes.frozen.sortIndicator.first, -1);
}


TEST_F(DataBridgeTest, HeaderClickWithoutSorting)
{
    model.unsortable.insert(2);
    bridge.setModel(&model);
    const size_t sortCalls = model.sortCalls.size();

    bridge.onColumnHeaderClicked(2); //unsortable column
    bridge.setSortableByHeaderClick(false);
    bridge.onColumnHeaderClicked(1);

    EXPECT_EQ(model.sortCalls.size(), sortCalls);
    EXPECT_EQ(clickedColumns, (std::vector<size_t> {2, 1})); //clicks are published regardless
}


TEST_F(DataBridgeTest, HeaderClickSortFailureKeepsState)
{
    bridge.setModel(&model);
    model.failSort = true;

    EXPECT_THROW(bridge.onColumnHeaderClicked(1), ModelError);
    EXPECT_EQ(bridge.getSortState(), (SortState{0, SortOrder::ascending}));
    EXPECT_TRUE(clickedColumns.empty());
}


TEST_F(DataBridgeTest, CellTextIsFormatted)
{
    bridge.setModel(&model);

    EXPECT_EQ(bridge.getCellText(3, 0), L"row3");
    EXPECT_EQ(bridge.getCellText(3, 1), L"3");
    EXPECT_EQ(bridge.getCellText(3, 2), L"1.50");
    EXPECT_EQ(bridge.getCellText(3, 7), L"");

    bridge.setNumberSymbols({L'.', L','});
    EXPECT_EQ(bridge.getCellText(3, 2), L"1,50");
}


TEST_F(DataBridgeTest, CheckBoxesInFirstColumnOnly)
{
    bridge.setModel(&model);

    EXPECT_EQ(bridge.getChecked(1, 0), false);
    EXPECT_FALSE(bridge.getChecked(1, 1).has_value());

    bridge.toggleChecked(1);
    EXPECT_EQ(bridge.getChecked(1, 0), true);
    EXPECT_EQ(panes.frozen.redrawnRows, (std::vector<size_t> {1}));
    EXPECT_EQ(panes.normal.redrawnRows, (std::vector<size_t> {1}));

    model.failCheck = true;
    EXPECT_THROW(bridge.toggleChecked(1), ModelError);
    EXPECT_EQ(bridge.getChecked(1, 0), true);
}


TEST_F(DataBridgeTest, SeparateCheckerOverridesModel)
{
    PlainModel plain(4);
    VectorModel checker{makeRows(4)};

    bridge.setModel(&plain);
    EXPECT_FALSE(bridge.getChecked(0, 0).has_value());

    bridge.setItemChecker(&checker);
    bridge.toggleChecked(2);
    EXPECT_TRUE(checker.isChecked(2));
    bridge.setModel(nullptr);
}


TEST_F(DataBridgeTest, AlternatingRowColor)
{
    bridge.setModel(&model);
    bridge.setAlternatingRowColor(Color{10, 10, 10});

    const CellStyle even = bridge.getCellStyle(0, 0);
    EXPECT_FALSE(even.background);
    EXPECT_FALSE(even.textColor);

    const CellStyle odd = bridge.getCellStyle(1, 0);
    EXPECT_EQ(odd.background, (Color{10, 10, 10}));
    EXPECT_EQ(odd.textColor,  (Color{255, 255, 255}));

    bridge.setAlternatingRowColor(Color{230, 230, 250});
    EXPECT_FALSE(bridge.getCellStyle(1, 0).textColor);
}


TEST_F(DataBridgeTest, StylerRunsAfterBaseline)
{
    RedTextStyler styler;
    bridge.setModel(&model);
    bridge.setAlternatingRowColor(Color{10, 10, 10});
    bridge.setCellStyler(&styler);

    EXPECT_EQ(bridge.getCellStyle(1, 1).textColor, (Color{255, 0, 0}));
    EXPECT_EQ(bridge.getCellStyle(1, 1).background, (Color{10, 10, 10}));
    EXPECT_EQ(bridge.getCellStyle(1, 0).textColor, (Color{255, 255, 255}));
}


TEST_F(DataBridgeTest, StylerReplacementRules)
{
    RedTextStyler styler;
    StylingModel styling1;
    StylingModel styling2;
    PlainModel plain(3);

    bridge.setCellStyler(&styler);
    bridge.setModel(&model);
    EXPECT_EQ(bridge.getCellStyler(), &styler); //separate styler survives

    bridge.setModel(&styling1);
    EXPECT_EQ(bridge.getCellStyler(), &styling1);

    bridge.setModel(&styling2);
    EXPECT_EQ(bridge.getCellStyler(), &styling2);

    bridge.setModel(&plain); //model-provided styler goes with its model
    EXPECT_EQ(bridge.getCellStyler(), nullptr);
    bridge.setModel(nullptr);
}


TEST_F(DataBridgeTest, ImagesAreAddedOncePerIdentity)
{
    auto icon = std::make_shared<ImageSource>();
    model.images[0] = ImageRef{icon, {}};
    model.images[1] = ImageRef{icon, {}};
    model.images[2] = ImageRef{nullptr, L"/icons/file.png"};
    model.images[3] = ImageRef{nullptr, L"/icons/file.png"};

    bridge.setModel(&model);
    EXPECT_EQ(bridge.getImageList(), nullptr); //created lazily

    EXPECT_EQ(bridge.getImageIndex(0, 0), 0);
    EXPECT_EQ(bridge.getImageIndex(1, 0), 0);
    EXPECT_EQ(bridge.getImageIndex(2, 0), 1);
    EXPECT_EQ(bridge.getImageIndex(3, 0), 1);
    EXPECT_EQ(bridge.getImageIndex(4, 0), -1);
    EXPECT_EQ(bridge.getImageIndex(0, 1), -1); //row images live in the first column
    EXPECT_EQ(imageAddCount, 2);
    EXPECT_NE(bridge.getImageList(), nullptr);

    PlainModel plain(2);
    bridge.setModel(&plain);
    EXPECT_EQ(bridge.getImageList(), nullptr);
    bridge.setModel(nullptr);
}


TEST_F(DataBridgeTest, RowNotificationsUpdatePanesAndSelection)
{
    bridge.setModel(&model);
    sel.setCurrentIndex(2);

    model.insertRows(0, 2);
    EXPECT_EQ(panes.normal.selected.size(), 7u);
    EXPECT_EQ(sel.getCurrentIndex(), 4);

    model.removeRows(4, 4);
    EXPECT_EQ(panes.frozen.selected.size(), 6u);
    EXPECT_EQ(sel.getCurrentIndex(), -1);

    sel.setCurrentIndex(1);
    model.resetRows(3);
    EXPECT_EQ(bridge.getRowCount(), 3u);
    EXPECT_EQ(sel.getCurrentIndex(), -1);
}


TEST_F(DataBridgeTest, ChangedRowIsResorted)
{
    bridge.setModel(&model);
    const size_t sortCalls = model.sortCalls.size();
    const int redraws = panes.normal.redrawAllCount;

    model.changeRow(3);

    EXPECT_EQ(model.sortCalls.size(), sortCalls + 1);
    EXPECT_GT(panes.normal.redrawAllCount, redraws);
}


TEST_F(DataBridgeTest, ChangedRowWithoutSorterIsRedrawn)
{
    PlainModel plain(5);
    bridge.setModel(&plain);

    bridge.updateItem(3);
    EXPECT_EQ(panes.frozen.redrawnRows, (std::vector<size_t> {3}));
    EXPECT_EQ(panes.normal.redrawnRows, (std::vector<size_t> {3}));
    bridge.setModel(nullptr);
}


TEST_F(DataBridgeTest, PopulatorLoadsRowsBeforePainting)
{
    LazyModel lazy;
    bridge.setModel(&lazy);
    EXPECT_EQ(bridge.getPopulator(), &lazy);

    bridge.prepareRows(2, 5);
    bridge.prepareRows(4, 6);

    EXPECT_EQ(lazy.populateCalls, 5);
    EXPECT_EQ(lazy.loaded, (std::set<size_t> {2, 3, 4, 5, 6}));
    bridge.setModel(nullptr);
}
