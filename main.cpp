#include "app/BidLensApp.hpp"

int main(int argc, char** argv) {
    bidlens::app::BidLensApp app;
    return app.Run(argc, argv);
}
