#pragma once

int cmd_agent(int argc, char** argv);
