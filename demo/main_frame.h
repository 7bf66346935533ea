// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#ifndef MAIN_FRAME_H_1047723908812556380
#define MAIN_FRAME_H_1047723908812556380

#include <wx/frame.h>
#include <wx/statusbr.h>
#include <frost/table_view.h>
#include "demo_model.h"


namespace frost_demo
{
class MainFrame : public wxFrame
{
public:
    static void create();

private:
    MainFrame();
    ~MainFrame();

    void onClose(wxCloseEvent& event);
    void onMenu(wxCommandEvent& event);
    void updateStatus();

    frost::TableView* table_ = nullptr;
    std::unique_ptr<DemoModel> model_;
    std::unique_ptr<frost::XmlFolderLayoutStore> layoutStore_;
};
}

#endif //MAIN_FRAME_H_1047723908812556380
