#include <Arduino.h>
#include "application.h"

static Application gApp;

void setup() {
    gApp.init();
}

void loop() {
    gApp.loop();
}
