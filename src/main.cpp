#include "app/App.h"

int main(int argc, char* argv[])
{
    gsuite::app::App app;
    return app.Run(argc, argv);
}
