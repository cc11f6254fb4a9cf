#include "AppMain.h"

int main(int argc, char* argv[])
{
    return RunNotifyApp(eMode::Others, argc, argv);
}
