#pragma once

int cmd_add(int argc, char** argv);
