#include "AppMain.h"

int main(int argc, char* argv[])
{
    return RunNotifyApp(eMode::All, argc, argv);
}
