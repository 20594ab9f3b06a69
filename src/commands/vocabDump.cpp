#include "commands/vocabDump.hpp"
#include "commands/common.hpp"

#include "io/JsonIO.hpp"

#include <iostream>

int cmd_vocab_dump(int argc, char** argv) {
    try {
        CommandSettings settings = load_command_settings(argc, argv);

        size_t skills = 0;
        for (const auto& c : settings.vocab.categories) skills += c.skills.size();

        std::cout << vocabularyToJson(settings.vocab).dump(2) << "\n";
        std::cerr << "categories=" << settings.vocab.categories.size() << " skills=" << skills << "\n";
        return 0;
    } catch (const std::exception& e) {
        return report_error(e);
    }
}
