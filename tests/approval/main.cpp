#define APPROVALS_CATCH2_V3
#include <catch2/catch_all.hpp>
#include <ApprovalTests/ApprovalTests.hpp>
#include <iostream>
#include <memory>

// Prints both file names instead of launching a diff tool
class EdlDiffReporter : public ApprovalTests::Reporter {
public:
	bool report(std::string received, std::string approved) const override {
		std::cout << "\n";
		std::cout << "EDL output differs from the approved file\n";
		std::cout << "Received: " << received << "\n";
		std::cout << "Approved: " << approved << "\n";
		std::cout << "\nTo approve the new output, copy the received file over the approved file\n";
		return true;
	}
};

int main(int argc, char* argv[]) {
	auto disposer = ApprovalTests::Approvals::useAsDefaultReporter(
		std::make_shared<EdlDiffReporter>()
	);

	return Catch::Session().run(argc, argv);
}
