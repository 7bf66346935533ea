// *****************************************************************************
// * This file is part of the FrostGrid project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The FrostGrid Authors - All Rights Reserved                 *
// *****************************************************************************

#include "application.h"
#include <iostream>
#include <wx/image.h>
#include <zen/extra_log.h>
#include <zen/i18n.h>
#include <zen/utf.h>
#include "main_frame.h"

using namespace zen;
using namespace frost_demo;

IMPLEMENT_APP(Application)


namespace
{
void notifyAppError(const std::wstring& msg)
{
    //no GUI left at this point
    std::cerr << utfTo<std::string>(_("Error") + L": " + msg) + '\n';
}
}


bool Application::OnInit()
{
    //do not call wxApp::OnInit() to avoid using wxWidgets command line parser

    initExtraLog([](const ErrorLog& log) //don't call functions depending on global state (which might be destroyed already!)
    {
        std::wstring msg;
        for (const LogEntry& e : log)
            msg += utfTo<std::wstring>(formatMessage(e));
        trim(msg);
        notifyAppError(msg);
    });

    wxInitAllImageHandlers(); //file-based row images

    SetAppName(L"FrostGridDemo"); //if not set, defaults to executable name

    MainFrame::create();
    return true; //true: continue processing; false: exit immediately.
}
