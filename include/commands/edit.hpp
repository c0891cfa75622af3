#pragma once

int cmd_edit(int argc, char** argv);
