/// Basic usage example for Formulary
/// Demonstrates the PrescriptionSession object-oriented API

#include <formulary/PrescriptionSession.hpp>
#include <iostream>

int main() {
    using namespace Formulary;

    // Herb table (normally loaded from the clinic database)
    std::vector<HerbRecord> herbs = {
        {1, "시호", "g"}, {2, "황금", "g"}, {3, "반하", "g"}, {4, "인삼", "g"},
        {5, "감초", "g"}, {6, "생강", "g"}, {7, "대추", "g"}, {8, "황련", "g"},
        {9, "건강", "g"}
    };

    // Formula definitions, leaf and combination forms
    std::vector<FormulaDefinition> definitions(3);
    definitions[0].id = 1;
    definitions[0].name = "소시호탕";
    definitions[0].alias = "소시호";
    definitions[0].composition = "시호:12/황금:6/반하:8/인삼:6/감초:4/생강:6/대추:6";
    definitions[1].id = 2;
    definitions[1].name = "반하사심탕";
    definitions[1].alias = "반하사심";
    definitions[1].composition = "반하:10/황금:6/황련:2/인삼:6/감초:6/건강:4/대추:6";
    definitions[2].id = 3;
    definitions[2].name = "시호반하합방";
    definitions[2].composition = "소시호*0.5+반하사심";

    PrescriptionSession session;
    session.setPrintResultsMode(1);
    session.loadCatalog(herbs, definitions);

    std::cout << "Catalog loaded: " << session.getNumberTemplates() << " templates\n";

    session.setPatientName("Example");
    session.setFormula("<소시호 반하사심*0.5>");
    session.setSchedule(15, 2);
    session.setTotalDoses(15);
    session.setPackVolume(100);
    session.setHerbAdjustment("+감초3 -대추10");

    int result = session.calculate();
    if (result != 0) {
        std::cerr << "Calculation failed (code " << result << "): "
                  << session.getErrorMessage() << std::endl;
        return 1;
    }

    session.printResults();

    // Unknown names are reported in one batch
    session.setFormula("반하 백호 계지");
    result = session.calculate();
    std::cout << "Second formula (code " << result << "): "
              << session.getErrorMessage() << "\n";

    return 0;
}
