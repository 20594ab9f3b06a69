#pragma once

int cmd_vocab_dump(int argc, char** argv);
