#include "framestream/subscriber_app.hpp"

int main(int argc, char* argv[]) {
    return framestream::run_subscriber_app(argc, argv, framestream::ProgramKind::View);
}
