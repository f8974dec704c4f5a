#include <catch2/catch_session.hpp>
#include <wx/init.h>

int main(int argc, char* argv[]) {
    // wxBase (settings files) needs the library initialised
    wxInitializer initializer;
    if (!initializer.IsOk()) return 1;

    Catch::Session session;
    int result = session.applyCommandLine(argc, argv);
    if (result != 0) return result;
    return session.run();
}
