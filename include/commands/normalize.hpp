#pragma once

int cmd_normalize(int argc, char** argv);
