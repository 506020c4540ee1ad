#pragma once

int cmd_strip(int argc, char** argv);
