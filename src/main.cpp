#include "app/Application.hpp"

int main(int argc, char** argv)
{
    return civerify::app::Application{ argc, argv }.run();
}
